#include "hallucination_filter.hpp"

#include <algorithm>

HallucinationFilter::HallucinationFilter(std::vector<std::string> phrases)
    : phrases_(std::move(phrases)) {
    // An empty phrase would match everything.
    std::erase_if(phrases_, [](const std::string& p) { return p.empty(); });
}

std::string_view HallucinationFilter::find_match(std::string_view text) const {
    auto it = std::ranges::find_if(phrases_, [text](const std::string& p) {
        return text.find(p) != std::string_view::npos;
    });
    return it != phrases_.end() ? std::string_view(*it) : std::string_view{};
}

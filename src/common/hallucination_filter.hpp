#pragma once

#include <string>
#include <string_view>
#include <vector>

// Drops transcripts that contain boilerplate whisper produces for silence or
// noise ("thanks for watching", subtitle credits). Matching is a plain
// substring search and any hit rejects the whole transcript.
class HallucinationFilter {
public:
    explicit HallucinationFilter(std::vector<std::string> phrases);

    // Returns the phrase that matched, or an empty view if the text is clean.
    std::string_view find_match(std::string_view text) const;

private:
    std::vector<std::string> phrases_;
};

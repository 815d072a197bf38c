#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "hallucination_filter.hpp"

TEST_CASE("HallucinationFilter", "[filter]") {
    HallucinationFilter filter(Config{}.hallucinations);

    SECTION("ExactPhraseMatches") {
        REQUIRE(filter.find_match("ご視聴ありがとうございました") == "ご視聴ありがとうございました");
        REQUIRE(filter.find_match("Amara.org") == "Amara.org");
    }

    SECTION("SubstringMatches") {
        REQUIRE(filter.find_match("今日の配信はここまで。チャンネル登録お願いします") == "チャンネル登録");
        REQUIRE(filter.find_match("高評価よろしく") == "高評価");
        REQUIRE_FALSE(filter.find_match("Subtitles by the Amara.org community").empty());
    }

    SECTION("CleanTextHasNoMatch") {
        REQUIRE(filter.find_match("明日の天気を教えて").empty());
        REQUIRE(filter.find_match("").empty());
    }

    SECTION("MatchIsCaseSensitive") {
        REQUIRE(filter.find_match("subtitles by me").empty());
    }

    SECTION("EmptyPhrasesIgnored") {
        HallucinationFilter f({"", "noise"});
        REQUIRE(f.find_match("hello").empty());
        REQUIRE(f.find_match("some noise") == "noise");
    }
}

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "corpus/filters/ScriptRatioFilters.hpp"

using namespace corpus;
using Catch::Matchers::WithinAbs;

namespace
{
bool keeps(const IFilter& filter, const std::string& src, const std::string& tgt)
{
    return filter.filter(SentencePair{ src, tgt }).has_value();
}
} // namespace

TEST_CASE("AlphabetRatioFilter scoring", "[filter][alphabet_ratio]")
{
    AlphabetRatioFilter with_spaces;
    AlphabetRatioFilter without_spaces(0.75, true);

    REQUIRE_THAT(*with_spaces.score("abc1"), WithinAbs(0.75, 1e-9));
    REQUIRE_THAT(*with_spaces.score("ab  "), WithinAbs(0.5, 1e-9));
    REQUIRE_THAT(*without_spaces.score("ab  "), WithinAbs(1.0, 1e-9));
    REQUIRE_THAT(*with_spaces.score("你好!"), WithinAbs(2.0 / 3.0, 1e-9));
    REQUIRE_FALSE(with_spaces.score("").has_value());
    REQUIRE_FALSE(without_spaces.score("   ").has_value());
}

TEST_CASE("AlphabetRatioFilter filtering", "[filter][alphabet_ratio]")
{
    AlphabetRatioFilter filter;

    REQUIRE(keeps(filter, "abc1", "hello"));
    REQUIRE_FALSE(keeps(filter, "a1!?", "hello"));
    REQUIRE_FALSE(keeps(filter, "hello", "12345"));

    SECTION("Whitespace counts against the ratio unless excluded")
    {
        REQUIRE_FALSE(keeps(filter, "a b c d", "hello"));
        AlphabetRatioFilter exclude(0.75, true);
        REQUIRE(keeps(exclude, "a b c d", "hello"));
    }

    SECTION("A side with nothing to measure is rejected")
    {
        AlphabetRatioFilter exclude(0.0, true);
        REQUIRE_FALSE(keeps(exclude, "  ", "hello"));
    }

    REQUIRE_THROWS_AS(AlphabetRatioFilter(1.01), std::invalid_argument);
}

TEST_CASE("CharacterRatioFilter zh/en examples", "[filter][character_ratio]")
{
    CharacterRatioFilter filter({ "zh", "en" }, { 1.0, 1.0 });

    REQUIRE(keeps(filter, "你好世界", "hello world"));
    REQUIRE_FALSE(keeps(filter, "你好world", "hello"));

    SECTION("Scores per side")
    {
        REQUIRE_THAT(*filter.score("你好world", 0), WithinAbs(2.0 / 7.0, 1e-9));
        REQUIRE_THAT(*filter.score("hello world!", 1), WithinAbs(1.0, 1e-9));
        REQUIRE_THAT(*filter.score("你好", 1), WithinAbs(0.0, 1e-9));
    }

    SECTION("Digits and punctuation are not counted")
    {
        REQUIRE(keeps(filter, "2024年，你好。", "Hello, 2024!"));
    }

    SECTION("A side without letters is rejected")
    {
        REQUIRE_FALSE(filter.score("123 !?", 0).has_value());
        REQUIRE_FALSE(keeps(filter, "123", "hello"));
    }
}

TEST_CASE("CharacterRatioFilter thresholds", "[filter][character_ratio]")
{
    SECTION("Default thresholds are 1")
    {
        CharacterRatioFilter filter({ "en", "ko" });
        REQUIRE(keeps(filter, "hello", "안녕하세요"));
        REQUIRE_FALSE(keeps(filter, "hello", "안녕 hi"));
    }

    SECTION("A score equal to the threshold is kept")
    {
        CharacterRatioFilter filter({ "Han", "Latin" }, { 0.5, 1.0 });
        REQUIRE(keeps(filter, "你好ab", "hello"));
        REQUIRE_FALSE(keeps(filter, "你abc", "hello"));
    }

    SECTION("Configuration errors")
    {
        REQUIRE_THROWS_AS(CharacterRatioFilter({ "zh" }), std::invalid_argument);
        REQUIRE_THROWS_AS(CharacterRatioFilter({ "zh", "en", "ja" }), std::invalid_argument);
        REQUIRE_THROWS_AS(CharacterRatioFilter({ "zh", "en" }, { 1.0 }), std::invalid_argument);
        REQUIRE_THROWS_AS(CharacterRatioFilter({ "zh", "xx-unknown" }), std::invalid_argument);
        REQUIRE_THROWS_AS(CharacterRatioFilter({ "zh", "en" }, { 1.0, 1.5 }), std::invalid_argument);
        REQUIRE_THROWS_AS(CharacterRatioFilter({ "ja", "en" }), std::invalid_argument);
    }
}

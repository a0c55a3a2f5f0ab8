#include <catch2/catch_test_macros.hpp>
#include <limits>
#include <stdexcept>
#include <string>

#include "corpus/filters/LengthFilters.hpp"
#include "text/TextUtils.hpp"

using namespace corpus;

namespace
{
bool keeps(const IFilter& filter, const std::string& src, const std::string& tgt)
{
    return filter.filter(SentencePair{ src, tgt }).has_value();
}
} // namespace

TEST_CASE("LengthBounds are inclusive", "[filter][len]")
{
    LengthBounds bounds{ 2, 4 };
    REQUIRE_FALSE(bounds.contains(1));
    REQUIRE(bounds.contains(2));
    REQUIRE(bounds.contains(4));
    REQUIRE_FALSE(bounds.contains(5));

    REQUIRE(LengthBounds{}.contains(0));
    REQUIRE(LengthBounds{ std::nullopt, 3 }.contains(0));
    REQUIRE_FALSE(LengthBounds{ 1, std::nullopt }.contains(0));
}

TEST_CASE("LenFilter", "[filter][len]")
{
    SECTION("Source bounds in code points")
    {
        LenFilter filter(LengthBounds{ 1, 10 });
        REQUIRE(keeps(filter, "hello", "world"));
        REQUIRE(keeps(filter, "你好", ""));
        REQUIRE_FALSE(keeps(filter, "", "x"));
        REQUIRE_FALSE(keeps(filter, "hello world", "x"));
        REQUIRE(keeps(filter, "一二三四五六七八九十", "x"));
    }

    SECTION("Target bounds in words")
    {
        LenFilter filter({}, LengthBounds{ 2, 3 }, {}, &text::spaceSeparatedLength);
        REQUIRE(keeps(filter, "x", "one two"));
        REQUIRE(keeps(filter, "x", " one  two three "));
        REQUIRE_FALSE(keeps(filter, "x", "one"));
        REQUIRE_FALSE(keeps(filter, "x", "a b c d"));
    }

    SECTION("min greater than max is rejected at construction")
    {
        REQUIRE_THROWS_AS(LenFilter(LengthBounds{ 5, 1 }), std::invalid_argument);
        REQUIRE_THROWS_AS(LenFilter({}, LengthBounds{ 3, 2 }), std::invalid_argument);
    }
}

TEST_CASE("LengthFilter combines bounds and ratio", "[filter][length]")
{
    LengthFilter filter;

    REQUIRE(keeps(filter, "abc", "abcdefghi"));
    REQUIRE_FALSE(keeps(filter, "abc", "abcdefghij"));
    REQUIRE_FALSE(keeps(filter, "abcdefghij", "abc"));

    SECTION("Bounds apply before the ratio")
    {
        LengthFilter bounded({}, {}, LengthBounds{ 1, 5 }, LengthBounds{ 1, 5 }, 3.0);
        REQUIRE(keeps(bounded, "abc", "abcd"));
        REQUIRE_FALSE(keeps(bounded, "abcdef", "abcdef"));
    }

    SECTION("Word length function")
    {
        LengthFilter words(&text::spaceSeparatedLength, &text::spaceSeparatedLength, {}, {}, 2.0);
        REQUIRE(keeps(words, "one two", "uno dos tres cuatro"));
        REQUIRE_FALSE(keeps(words, "one", "uno dos tres"));
    }

    SECTION("Non-positive ratio is a configuration error")
    {
        REQUIRE_THROWS_AS(LengthFilter({}, {}, {}, {}, 0.0), std::invalid_argument);
        REQUIRE_THROWS_AS(LengthFilter({}, {}, {}, {}, -1.0), std::invalid_argument);
    }
}

TEST_CASE("LenDiffFilter keeps pairs within the ratio both ways", "[filter][len_diff]")
{
    SECTION("ratio 0.5 rejects ab / abcdefgh")
    {
        LenDiffFilter filter(0.5);
        // 2 <= 0.5 * 8 holds, 8 <= 0.5 * 2 does not
        REQUIRE_FALSE(keeps(filter, "ab", "abcdefgh"));
        REQUIRE_FALSE(keeps(filter, "abcdefgh", "ab"));
    }

    SECTION("Formula holds for a range of lengths")
    {
        LenDiffFilter filter(2.0);
        for (std::size_t s = 1; s <= 8; ++s)
        {
            for (std::size_t t = 1; t <= 8; ++t)
            {
                const bool expected = s <= 2 * t && t <= 2 * s;
                REQUIRE(keeps(filter, std::string(s, 'a'), std::string(t, 'b')) == expected);
            }
        }
    }

    SECTION("Lengths are measured in code points")
    {
        LenDiffFilter filter(1.0);
        REQUIRE(keeps(filter, "你好", "hi"));
    }

    SECTION("Invalid ratios")
    {
        REQUIRE_THROWS_AS(LenDiffFilter(0.0), std::invalid_argument);
        REQUIRE_THROWS_AS(LenDiffFilter(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
    }

    REQUIRE(withinRatio(3, 6, 2.0));
    REQUIRE_FALSE(withinRatio(3, 7, 2.0));
}

TEST_CASE("LongWordFilter", "[filter][long_word]")
{
    REQUIRE(LongWordFilter::longestWord("a bb 你好世界") == 4);
    REQUIRE(LongWordFilter::longestWord("   ") == 0);

    SECTION("Default limit of 40 code points")
    {
        LongWordFilter filter;
        REQUIRE(keeps(filter, std::string(40, 'x'), "short words"));
        REQUIRE_FALSE(keeps(filter, std::string(41, 'x'), "short words"));
        REQUIRE_FALSE(keeps(filter, "fine", "see " + std::string(41, 'y')));
    }

    SECTION("A disabled side is never checked")
    {
        LongWordFilter filter(3, std::nullopt);
        REQUIRE(keeps(filter, "abc de", std::string(100, 'z')));
        REQUIRE_FALSE(keeps(filter, "abcd", "z"));
    }
}

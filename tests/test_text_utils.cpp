#include <catch2/catch_test_macros.hpp>
#include <string>

#include "text/TextUtils.hpp"

using namespace text;

TEST_CASE("UTF-8 and UTF-32 conversion", "[text]")
{
    SECTION("Mixed scripts round trip")
    {
        const std::string s = "abc 你好 ｶﾀｶﾅ 😀";
        REQUIRE(utf32ToUtf8(utf8ToUtf32(s)) == s);
    }

    SECTION("Code point count, not byte count")
    {
        REQUIRE(utf8ToUtf32("你好").size() == 2);
        REQUIRE(charLength("你好") == 2);
        REQUIRE(charLength("") == 0);
    }

    SECTION("Invalid bytes decode to the replacement character")
    {
        std::u32string cps = utf8ToUtf32(std::string("a\xFF" "b"));
        REQUIRE(cps.size() == 3);
        REQUIRE(cps[0] == U'a');
        REQUIRE(cps[1] == U'\uFFFD');
        REQUIRE(cps[2] == U'b');
    }
}

TEST_CASE("ASCII helpers", "[text]")
{
    REQUIRE(isAscii(""));
    REQUIRE(isAscii("hello, world!"));
    REQUIRE_FALSE(isAscii("café"));
    REQUIRE(countAscii("ab你好") == 2);
    REQUIRE(countAscii("") == 0);
}

TEST_CASE("Chinese character detection", "[text]")
{
    REQUIRE(hasZh("hello 世界"));
    REQUIRE_FALSE(hasZh("hello world"));
    // kana are not CJK unified ideographs
    REQUIRE_FALSE(hasZh("ひらがな"));
    REQUIRE(isCjkUnified(U'一'));
    REQUIRE(isCjkUnified(U'㐀'));
    REQUIRE(isCjkUnified(U'\U00020000'));
    REQUIRE_FALSE(isCjkUnified(U'a'));
}

TEST_CASE("Whitespace handling", "[text]")
{
    SECTION("Unicode whitespace is recognized")
    {
        REQUIRE(isWhitespace(U' '));
        REQUIRE(isWhitespace(U'\t'));
        REQUIRE(isWhitespace(U'\n'));
        REQUIRE(isWhitespace(U'\u3000'));
        REQUIRE(isWhitespace(U'\u00A0'));
        REQUIRE_FALSE(isWhitespace(U'a'));
        REQUIRE_FALSE(isWhitespace(U'你'));
    }

    SECTION("trim strips both ends only")
    {
        REQUIRE(trim("  a b  ") == "a b");
        REQUIRE(trim("\u3000你好\u3000") == "你好");
        REQUIRE(trim(" \t\n ").empty());
        REQUIRE(trim("").empty());
    }

    SECTION("splitWhitespace drops empty tokens")
    {
        auto words = splitWhitespace("  one two\t\tthree ");
        REQUIRE(words.size() == 3);
        REQUIRE(words[0] == "one");
        REQUIRE(words[2] == "three");
        REQUIRE(spaceSeparatedLength("  one two\t\tthree ") == 3);
        REQUIRE(spaceSeparatedLength("   ") == 0);
    }
}

TEST_CASE("Lower-casing is Unicode aware", "[text]")
{
    REQUIRE(toLower("HeLLo") == "hello");
    REQUIRE(toLower("ÄÖÜ") == "äöü");
    REQUIRE(toLower("ПРИВЕТ") == "привет");
    REQUIRE(toLower("你好") == "你好");
}

TEST_CASE("replaceAll scans left to right without rescanning", "[text]")
{
    std::string s = "aaaa";
    replaceAll(s, "aa", "");
    REQUIRE(s.empty());

    s = "aaa";
    replaceAll(s, "aa", "");
    REQUIRE(s == "a");

    s = "x--y--z";
    replaceAll(s, "--", "-");
    REQUIRE(s == "x-y-z");

    s = "unchanged";
    replaceAll(s, "", "boom");
    REQUIRE(s == "unchanged");
}

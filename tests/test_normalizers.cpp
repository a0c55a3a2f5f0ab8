#include <catch2/catch_test_macros.hpp>
#include <random>
#include <string>
#include <vector>

#include "corpus/normalizers/NoPrintNormalizer.hpp"
#include "corpus/normalizers/SpaceNormalizer.hpp"
#include "text/TextUtils.hpp"

using namespace corpus;
using namespace std::string_literals;

namespace
{
// Random strings over a pool mixing whitespace, controls, ASCII and CJK
std::vector<std::string> randomUnicodeStrings(std::size_t count)
{
    const std::u32string pool = U"abZ1. \t\n\u3000\u00A0\u2003你好éЖ\x01\x1F\x7F😀";
    std::mt19937 rng(20240501u);
    std::uniform_int_distribution<std::size_t> pick(0, pool.size() - 1);
    std::uniform_int_distribution<std::size_t> length(0, 24);

    std::vector<std::string> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        std::u32string s;
        const std::size_t n = length(rng);
        for (std::size_t j = 0; j < n; ++j)
            s.push_back(pool[pick(rng)]);
        out.push_back(text::utf32ToUtf8(s));
    }
    return out;
}
} // namespace

TEST_CASE("SpaceNormalizer examples", "[normalizer][space]")
{
    SpaceNormalizer normalizer;

    REQUIRE(normalizer.normalize("hello   world"s) == "hello world");
    REQUIRE(normalizer.normalize("你好 世界"s) == "你好世界");
    REQUIRE(normalizer.normalize("  padded  "s) == "padded");

    SECTION("Spaces next to non-ASCII characters are dropped")
    {
        REQUIRE(normalizer.normalize("hello 世界"s) == "hello世界");
        REQUIRE(normalizer.normalize("价格 100 元"s) == "价格100元");
    }

    SECTION("Ideographic and no-break spaces become ASCII spaces")
    {
        REQUIRE(normalizer.normalize("a\u3000b"s) == "a b");
        REQUIRE(normalizer.normalize("a\u00A0b"s) == "a b");
        REQUIRE(normalizer.normalize("\u3000你好\u3000"s) == "你好");
    }

    SECTION("Whitespace runs collapse, single characters are kept")
    {
        REQUIRE(normalizer.normalize("a \t b"s) == "a b");
        REQUIRE(normalizer.normalize("a\tb"s) == "a\tb");
    }

    REQUIRE(normalizer.normalize(""s).empty());
    REQUIRE(normalizer.normalize(" \t "s).empty());
}

TEST_CASE("SpaceNormalizer applies to both sides", "[normalizer][space]")
{
    SpaceNormalizer normalizer;
    const INormalizer& as_interface = normalizer;

    auto out = as_interface.normalize(SentencePair{ " hello  world ", "你好 世界" });
    REQUIRE(out.source == "hello world");
    REQUIRE(out.target == "你好世界");
    REQUIRE(as_interface.name() == "space");
}

TEST_CASE("NoPrintNormalizer removes control characters", "[normalizer][no_print]")
{
    NoPrintNormalizer normalizer;

    REQUIRE(normalizer.normalize("a\0" "b\x1f" "c"s) == "abc");
    REQUIRE(normalizer.normalize("line\nbreak\r"s) == "linebreak");
    REQUIRE(normalizer.normalize("del\x7f"s) == "del");

    SECTION("Tab and non-ASCII text survive")
    {
        REQUIRE(normalizer.normalize("a\tb"s) == "a\tb");
        REQUIRE(normalizer.normalize("你好 café 😀"s) == "你好 café 😀");
    }

    auto out = normalizer.normalize(SentencePair{ "x\x01y", "\x02z" });
    REQUIRE(out == SentencePair{ "xy", "z" });
}

TEST_CASE("Space and NoPrint normalizers are idempotent", "[normalizer][property]")
{
    SpaceNormalizer space;
    NoPrintNormalizer no_print;

    for (const auto& s : randomUnicodeStrings(500))
    {
        INFO("input bytes: " << s.size());

        const std::string spaced = space.normalize(s);
        REQUIRE(space.normalize(spaced) == spaced);

        const std::string printable = no_print.normalize(s);
        REQUIRE(no_print.normalize(printable) == printable);
    }
}

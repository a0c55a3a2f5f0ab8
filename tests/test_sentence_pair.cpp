#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include <string>

#include "corpus/Diagnostics.hpp"
#include "corpus/SentencePair.hpp"

using namespace corpus;

TEST_CASE("TabPairCodec decodes exactly two fields", "[codec]")
{
    auto pair = TabPairCodec::decode("hello\tworld");
    REQUIRE(pair.has_value());
    REQUIRE(pair->source == "hello");
    REQUIRE(pair->target == "world");

    SECTION("Empty fields are allowed")
    {
        auto empty = TabPairCodec::decode("\t");
        REQUIRE(empty.has_value());
        REQUIRE(empty->source.empty());
        REQUIRE(empty->target.empty());
    }

    SECTION("Wrong field counts")
    {
        REQUIRE_FALSE(TabPairCodec::decode("no tab").has_value());
        REQUIRE_FALSE(TabPairCodec::decode("a\tb\tc").has_value());
        REQUIRE_FALSE(TabPairCodec::decode("").has_value());
    }

    REQUIRE(TabPairCodec::encode(SentencePair{ "你好", "hi" }) == "你好\thi");
}

TEST_CASE("Diagnostics preview", "[diagnostics]")
{
    const auto saved = Diagnostics::Current();

    SECTION("Short text is escaped, not truncated")
    {
        Diagnostics::Apply({ .verbose = false, .max_preview = 160 });
        REQUIRE(Diagnostics::Preview("a\tb\nc") == "a\\tb\\nc");
        REQUIRE(Diagnostics::Preview(std::string("x\x01y")) == "x?y");
        REQUIRE(Diagnostics::PreviewPair(SentencePair{ "你好", "hi\r" }) == "src=你好 tgt=hi\\r");
    }

    SECTION("Truncation keeps whole UTF-8 sequences")
    {
        Diagnostics::Apply({ .verbose = false, .max_preview = 5 });
        REQUIRE(Diagnostics::Preview("héllo world") == "héll... (12 bytes)");

        Diagnostics::Apply({ .verbose = false, .max_preview = 2 });
        REQUIRE(Diagnostics::Preview("héllo world") == "h... (12 bytes)");
    }

    SECTION("Verbose switch")
    {
        Diagnostics::Apply({ .verbose = true, .max_preview = 160 });
        REQUIRE(Diagnostics::IsVerbose());
        Diagnostics::Apply({ .verbose = false, .max_preview = 160 });
        REQUIRE_FALSE(Diagnostics::IsVerbose());
    }

    Diagnostics::Apply(saved);
}

TEST_CASE("Diagnostics settings from the [diagnostics] table", "[diagnostics][config]")
{
    auto defaults = Diagnostics::ParseSettings(toml::table{});
    REQUIRE_FALSE(defaults.verbose);
    REQUIRE(defaults.max_preview == 160);

    auto settings = Diagnostics::ParseSettings(toml::parse("verbose = true\nmax_preview = 40\n"));
    REQUIRE(settings.verbose);
    REQUIRE(settings.max_preview == 40);

    REQUIRE_THROWS_AS(Diagnostics::ParseSettings(toml::parse("max_preview = 0\n")), std::invalid_argument);
    REQUIRE_THROWS_AS(Diagnostics::ParseSettings(toml::parse("verbose = \"yes\"\n")), std::invalid_argument);
}

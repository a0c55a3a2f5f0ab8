#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "corpus/Pipeline.hpp"
#include "corpus/filters/BasicFilters.hpp"
#include "corpus/filters/LengthFilters.hpp"
#include "corpus/normalizers/NoPrintNormalizer.hpp"
#include "corpus/normalizers/SpaceNormalizer.hpp"

using namespace corpus;

namespace
{
class ThrowingFilter final : public IFilter
{
public:
    std::optional<SentencePair> filter(const SentencePair&) const override
    {
        throw std::runtime_error("detector crashed");
    }
    std::string name() const override { return "throwing"; }
};

std::vector<SentencePair> run(const Pipeline& pipeline, const std::vector<SentencePair>& pairs)
{
    std::vector<SentencePair> kept;
    for (const auto& pair : pairs)
    {
        auto outcome = pipeline.process(pair);
        if (outcome.kept())
            kept.push_back(*outcome.pair);
    }
    return kept;
}
} // namespace

TEST_CASE("Empty, length and same filters end to end", "[pipeline]")
{
    Pipeline pipeline;
    pipeline.addFilter(std::make_unique<EmptyFilter>())
        .addFilter(std::make_unique<LenFilter>(LengthBounds{ 1, 10 }))
        .addFilter(std::make_unique<SameFilter>());

    const std::vector<SentencePair> input = {
        { "a", "a" },
        { "hello", "world" },
        { "", "x" },
    };

    auto kept = run(pipeline, input);
    REQUIRE(kept.size() == 1);
    REQUIRE(kept[0] == SentencePair{ "hello", "world" });
}

TEST_CASE("Outcome names the first rejecting filter", "[pipeline]")
{
    Pipeline pipeline;
    pipeline.addFilter(std::make_unique<EmptyFilter>()).addFilter(std::make_unique<SameFilter>());

    auto outcome = pipeline.process(SentencePair{ "", "" });
    REQUIRE_FALSE(outcome.kept());
    REQUIRE(outcome.rejected_by == "empty");
    REQUIRE_FALSE(outcome.error.has_value());

    outcome = pipeline.process(SentencePair{ "same", "SAME" });
    REQUIRE(outcome.rejected_by == "same");
}

TEST_CASE("Normalizers run before filters and mark rewrites", "[pipeline]")
{
    Pipeline pipeline;
    pipeline.addNormalizer(std::make_unique<NoPrintNormalizer>())
        .addNormalizer(std::make_unique<SpaceNormalizer>())
        .addFilter(std::make_unique<EmptyFilter>());

    SECTION("A rewritten pair is kept and flagged")
    {
        auto outcome = pipeline.process(SentencePair{ "hello\x01   world", "你好 世界" });
        REQUIRE(outcome.kept());
        REQUIRE(outcome.modified);
        REQUIRE(*outcome.pair == SentencePair{ "hello world", "你好世界" });
    }

    SECTION("An already clean pair is not flagged")
    {
        auto outcome = pipeline.process(SentencePair{ "hello world", "你好世界" });
        REQUIRE(outcome.kept());
        REQUIRE_FALSE(outcome.modified);
    }

    SECTION("Filters see the normalized text")
    {
        auto outcome = pipeline.process(SentencePair{ "\x02\x03", "x" });
        REQUIRE_FALSE(outcome.kept());
        REQUIRE(outcome.rejected_by == "empty");
    }

    REQUIRE(pipeline.normalizerNames() == std::vector<std::string>{ "no_print", "space" });
    REQUIRE(pipeline.filterNames() == std::vector<std::string>{ "empty" });
}

TEST_CASE("A failing stage drops the pair without stopping the stream", "[pipeline]")
{
    Pipeline pipeline;
    pipeline.addFilter(std::make_unique<EmptyFilter>()).addFilter(std::make_unique<ThrowingFilter>());

    auto failed = pipeline.process(SentencePair{ "a", "b" });
    REQUIRE_FALSE(failed.kept());
    REQUIRE(failed.rejected_by == "throwing");
    REQUIRE(failed.error.has_value());
    REQUIRE(*failed.error == "detector crashed");

    // rejected earlier, never reaches the throwing stage
    auto rejected = pipeline.process(SentencePair{ "", "b" });
    REQUIRE(rejected.rejected_by == "empty");
    REQUIRE_FALSE(rejected.error.has_value());
}

TEST_CASE("Null stages are refused", "[pipeline]")
{
    Pipeline pipeline;
    REQUIRE_THROWS_AS(pipeline.addFilter(nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(pipeline.addNormalizer(nullptr), std::invalid_argument);
    REQUIRE(pipeline.empty());
}

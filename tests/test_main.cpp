// Catch2WithMain provides main(); this file only holds the smoke test

#include <catch2/catch_test_macros.hpp>

#include "corpus/Pipeline.hpp"

TEST_CASE("Framework smoke test", "[smoke]")
{
    corpus::Pipeline pipeline;
    REQUIRE(pipeline.empty());

    auto outcome = pipeline.process(corpus::SentencePair{ "a", "b" });
    REQUIRE(outcome.kept());
    REQUIRE_FALSE(outcome.modified);
}

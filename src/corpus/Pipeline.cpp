#include "Pipeline.hpp"
#include "Diagnostics.hpp"
#include "StageRunner.hpp"

#include <stdexcept>

#include <plog/Log.h>

namespace corpus
{

namespace
{

void logRejection(const std::string& filter, const SentencePair& pair)
{
    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance) << "[Pipeline] rejected_by=" << filter << ' '
                                              << Diagnostics::PreviewPair(pair);
}

void logRewrite(const std::string& normalizer, const SentencePair& before, const SentencePair& after)
{
    if (Diagnostics::IsVerbose() && before != after)
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[Pipeline] normalizer=" << normalizer
                                               << " before: " << Diagnostics::PreviewPair(before)
                                               << " after: " << Diagnostics::PreviewPair(after);
}

} // anonymous namespace

Pipeline& Pipeline::addNormalizer(std::unique_ptr<INormalizer> normalizer)
{
    if (!normalizer)
        throw std::invalid_argument("Pipeline: null normalizer");
    normalizers_.push_back(std::move(normalizer));
    return *this;
}

Pipeline& Pipeline::addFilter(std::unique_ptr<IFilter> filter)
{
    if (!filter)
        throw std::invalid_argument("Pipeline: null filter");
    filters_.push_back(std::move(filter));
    return *this;
}

PairOutcome Pipeline::process(const SentencePair& pair) const
{
    PairOutcome outcome;
    SentencePair current = pair;

    for (const auto& normalizer : normalizers_)
    {
        const std::string stage = normalizer->name();
        auto stage_result = run_stage<SentencePair>(stage,
                                                    [&]()
                                                    {
                                                        return normalizer->normalize(current);
                                                    });
        if (!stage_result.succeeded)
        {
            outcome.rejected_by = stage;
            outcome.error = stage_result.error;
            return outcome;
        }
        logRewrite(stage, current, stage_result.result);
        current = std::move(stage_result.result);
    }

    for (const auto& filter : filters_)
    {
        const std::string stage = filter->name();
        auto stage_result = run_stage<std::optional<SentencePair>>(stage,
                                                                   [&]()
                                                                   {
                                                                       return filter->filter(current);
                                                                   });
        if (!stage_result.succeeded)
        {
            outcome.rejected_by = stage;
            outcome.error = stage_result.error;
            return outcome;
        }
        if (!stage_result.result)
        {
            logRejection(stage, current);
            outcome.rejected_by = stage;
            return outcome;
        }
        current = std::move(*stage_result.result);
    }

    outcome.modified = current != pair;
    outcome.pair = std::move(current);
    return outcome;
}

std::vector<std::string> Pipeline::normalizerNames() const
{
    std::vector<std::string> names;
    names.reserve(normalizers_.size());
    for (const auto& normalizer : normalizers_)
        names.push_back(normalizer->name());
    return names;
}

std::vector<std::string> Pipeline::filterNames() const
{
    std::vector<std::string> names;
    names.reserve(filters_.size());
    for (const auto& filter : filters_)
        names.push_back(filter->name());
    return names;
}

} // namespace corpus

#pragma once

#include "IFilter.hpp"
#include "INormalizer.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace corpus
{

struct PairOutcome
{
    std::optional<SentencePair> pair;  // set when the pair survives
    std::string rejected_by;           // name of the rejecting filter
    std::optional<std::string> error;  // set when a stage threw
    bool modified = false;             // survived, but a normalizer rewrote it

    [[nodiscard]] bool kept() const { return pair.has_value(); }
};

/**
 * @brief Ordered normalizers followed by ordered filters.
 *
 * Built once, then process() is const and may be called from several threads.
 * Filtering stops at the first rejection.
 */
class Pipeline
{
public:
    Pipeline() = default;
    Pipeline(Pipeline&&) = default;
    Pipeline& operator=(Pipeline&&) = default;

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    Pipeline& addNormalizer(std::unique_ptr<INormalizer> normalizer);
    Pipeline& addFilter(std::unique_ptr<IFilter> filter);

    [[nodiscard]] PairOutcome process(const SentencePair& pair) const;

    [[nodiscard]] std::vector<std::string> normalizerNames() const;
    [[nodiscard]] std::vector<std::string> filterNames() const;
    [[nodiscard]] bool empty() const { return normalizers_.empty() && filters_.empty(); }

private:
    std::vector<std::unique_ptr<INormalizer>> normalizers_;
    std::vector<std::unique_ptr<IFilter>> filters_;
};

} // namespace corpus

#pragma once

#include "SentencePair.hpp"

#include <optional>
#include <string>

namespace corpus
{

/**
 * @brief A parallel corpus filter.
 *
 * Configuration is fixed at construction; filter() must be callable
 * concurrently on independent pairs.
 */
class IFilter
{
public:
    virtual ~IFilter() = default;

    /**
     * @param pair source and target sentence
     * @return std::nullopt if the pair is rejected, otherwise the pair
     */
    [[nodiscard]] virtual std::optional<SentencePair> filter(const SentencePair& pair) const = 0;

    // Stable identifier used in statistics and log lines
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace corpus

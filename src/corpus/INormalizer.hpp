#pragma once

#include "SentencePair.hpp"

#include <string>

namespace corpus
{

/**
 * @brief Rewrites a sentence pair into a canonical form. Never rejects.
 *
 * Normalizers are stateless apart from data prepared in the constructor.
 */
class INormalizer
{
public:
    virtual ~INormalizer() = default;

    [[nodiscard]] virtual SentencePair normalize(const SentencePair& pair) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Applies a normalizer to a tab-joined "src\ttgt" line.
 *
 * A line that does not split into exactly two fields is returned unchanged
 * and logged on the diagnostics logger.
 */
[[nodiscard]] std::string normalizeSerialized(const INormalizer& normalizer, const std::string& line);

} // namespace corpus

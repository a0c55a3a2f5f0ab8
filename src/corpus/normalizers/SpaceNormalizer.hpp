#pragma once

#include "../INormalizer.hpp"

namespace corpus
{

/**
 * @brief Removes unnecessary spaces.
 *
 * Trims, maps ideographic and no-break spaces to ASCII space, collapses runs
 * of two or more whitespace characters into one space, then drops every
 * space next to a non-ASCII character. Spaces only survive between ASCII
 * tokens. Idempotent.
 */
class SpaceNormalizer final : public INormalizer
{
public:
    [[nodiscard]] std::string normalize(const std::string& s) const;
    [[nodiscard]] SentencePair normalize(const SentencePair& pair) const override;
    [[nodiscard]] std::string name() const override { return "space"; }
};

} // namespace corpus

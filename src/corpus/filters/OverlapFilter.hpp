#pragma once

#include "../IFilter.hpp"

namespace corpus
{

/**
 * @brief Rejects pairs whose source and target overlap too much.
 *
 * Similarity is the normalized Indel ratio of the two code point sequences
 * (rapidfuzz::fuzz::ratio scaled to [0.0, 1.0]). A pair is rejected when the
 * similarity is strictly greater than `ratio`.
 */
class OverlapFilter final : public IFilter
{
public:
    explicit OverlapFilter(double ratio = 0.8);

    [[nodiscard]] std::optional<SentencePair> filter(const SentencePair& pair) const override;
    [[nodiscard]] std::string name() const override { return "overlap"; }

    [[nodiscard]] static double similarity(const std::string& s1, const std::string& s2);

private:
    double ratio_;
};

} // namespace corpus

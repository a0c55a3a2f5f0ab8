#pragma once

#include "../INormalizer.hpp"

#include <utility>
#include <vector>

namespace corpus
{

// Opening and closing bracket, UTF-8 encoded
using PunctPair = std::pair<std::string, std::string>;

/// “” "" ‘’ （） 《》 ()
const std::vector<PunctPair>& defaultPunctPairs();

/**
 * @brief Repairs one kind of paired punctuation in a sentence.
 *
 * Doubled brackets are removed, tripled ones collapsed. Then the first
 * opening bracket with no closing bracket after it is deleted, and the first
 * closing bracket with no opening bracket before it is deleted.
 */
[[nodiscard]] std::string normalizePairPunct(std::string s, const std::string& left, const std::string& right);

/**
 * @brief Balances paired punctuation on each side of a pair independently.
 *
 * Use normalizeSerialized() for tab-joined lines.
 */
class PairPunctNormalizer final : public INormalizer
{
public:
    explicit PairPunctNormalizer(std::vector<PunctPair> punct_pairs = defaultPunctPairs());

    [[nodiscard]] SentencePair normalize(const SentencePair& pair) const override;
    [[nodiscard]] std::string name() const override { return "pair_punct"; }

private:
    std::vector<PunctPair> punct_pairs_;
};

} // namespace corpus

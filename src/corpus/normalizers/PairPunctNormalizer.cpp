#include "PairPunctNormalizer.hpp"
#include "text/TextUtils.hpp"

#include <stdexcept>

namespace corpus
{

const std::vector<PunctPair>& defaultPunctPairs()
{
    static const std::vector<PunctPair> kPairs = {
        { "“", "”" },
        { "\"", "\"" },
        { "‘", "’" },
        { "（", "）" },
        { "《", "》" },
        { "(", ")" },
    };
    return kPairs;
}

std::string normalizePairPunct(std::string s, const std::string& left, const std::string& right)
{
    text::replaceAll(s, left + left, "");
    text::replaceAll(s, left + left + left, left);

    text::replaceAll(s, right + right, "");
    text::replaceAll(s, right + right + right, right);

    // identical marks pair up in order, so only an odd count leaves one unmatched: the last
    if (left == right)
    {
        std::size_t count = 0;
        std::size_t last = std::string::npos;
        for (std::size_t pos = s.find(left); pos != std::string::npos; pos = s.find(left, pos + left.size()))
        {
            ++count;
            last = pos;
        }
        if (count % 2 == 1)
            s.erase(last, left.size());
        return s;
    }

    std::size_t idx = s.find(left);
    if (idx != std::string::npos && s.find(right, idx + left.size()) == std::string::npos)
    {
        s.erase(idx, left.size());
    }

    idx = s.find(right);
    if (idx != std::string::npos)
    {
        std::size_t opening = s.find(left);
        bool has_pair = opening != std::string::npos && opening + left.size() <= idx;
        if (!has_pair)
            s.erase(idx, right.size());
    }

    return s;
}

PairPunctNormalizer::PairPunctNormalizer(std::vector<PunctPair> punct_pairs)
    : punct_pairs_(std::move(punct_pairs))
{
    for (const auto& [left, right] : punct_pairs_)
    {
        if (left.empty() || right.empty())
            throw std::invalid_argument("pair_punct: brackets must not be empty");
    }
}

SentencePair PairPunctNormalizer::normalize(const SentencePair& pair) const
{
    SentencePair out = pair;
    for (const auto& [left, right] : punct_pairs_)
    {
        out.source = normalizePairPunct(std::move(out.source), left, right);
        out.target = normalizePairPunct(std::move(out.target), left, right);
    }
    return out;
}

} // namespace corpus

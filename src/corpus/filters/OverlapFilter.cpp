#include "OverlapFilter.hpp"
#include "text/TextUtils.hpp"

#include <rapidfuzz/fuzz.hpp>

#include <cmath>
#include <stdexcept>

namespace corpus
{

OverlapFilter::OverlapFilter(double ratio)
    : ratio_(ratio)
{
    if (!std::isfinite(ratio) || ratio < 0.0 || ratio > 1.0)
        throw std::invalid_argument("overlap: ratio must be within [0, 1]");
}

double OverlapFilter::similarity(const std::string& s1, const std::string& s2)
{
    if (s1.empty() && s2.empty())
        return 1.0;

    // Compare code points, not bytes, so CJK text is not over-counted
    const std::u32string a = text::utf8ToUtf32(s1);
    const std::u32string b = text::utf8ToUtf32(s2);

    // Normalize from [0, 100] to [0.0, 1.0]
    return rapidfuzz::fuzz::ratio(a, b) / 100.0;
}

std::optional<SentencePair> OverlapFilter::filter(const SentencePair& pair) const
{
    if (similarity(pair.source, pair.target) > ratio_)
        return std::nullopt;
    return pair;
}

} // namespace corpus

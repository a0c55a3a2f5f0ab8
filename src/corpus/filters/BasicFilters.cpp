#include "BasicFilters.hpp"
#include "text/TextUtils.hpp"

#include <cmath>
#include <stdexcept>

namespace corpus
{

SameFilter::SameFilter(bool lower)
    : lower_(lower)
{
}

std::optional<SentencePair> SameFilter::filter(const SentencePair& pair) const
{
    std::string src = text::trim(pair.source);
    std::string tgt = text::trim(pair.target);
    if (lower_)
    {
        src = text::toLower(src);
        tgt = text::toLower(tgt);
    }

    if (src == tgt)
        return std::nullopt;
    return pair;
}

HasZhFilter::HasZhFilter(bool filter_src)
    : filter_src_(filter_src)
{
}

std::optional<SentencePair> HasZhFilter::filter(const SentencePair& pair) const
{
    const std::string& checked = filter_src_ ? pair.source : pair.target;
    if (text::hasZh(checked))
        return std::nullopt;
    return pair;
}

std::optional<SentencePair> EmptyFilter::filter(const SentencePair& pair) const
{
    if (text::trim(pair.source).empty() || text::trim(pair.target).empty())
        return std::nullopt;
    return pair;
}

std::optional<SentencePair> AllASCII::filter(const SentencePair& pair) const
{
    if (text::isAscii(pair.source) && text::isAscii(pair.target))
        return std::nullopt;
    return pair;
}

ASCIIRatioFilter::ASCIIRatioFilter(double threshold, bool filter_src, bool filter_tgt)
    : threshold_(threshold)
    , filter_src_(filter_src)
    , filter_tgt_(filter_tgt)
{
    if (!std::isfinite(threshold) || threshold < 0.0 || threshold > 1.0)
        throw std::invalid_argument("ascii_ratio: threshold must be within [0, 1]");
}

std::optional<double> ASCIIRatioFilter::score(const std::string& s)
{
    std::size_t total = text::charLength(s);
    if (total == 0)
        return std::nullopt;
    return static_cast<double>(text::countAscii(s)) / static_cast<double>(total);
}

bool ASCIIRatioFilter::tooMuchAscii(const std::string& s) const
{
    auto ratio = score(s);
    return !ratio || *ratio > threshold_;
}

std::optional<SentencePair> ASCIIRatioFilter::filter(const SentencePair& pair) const
{
    if (filter_src_ && tooMuchAscii(pair.source))
        return std::nullopt;
    if (filter_tgt_ && tooMuchAscii(pair.target))
        return std::nullopt;
    return pair;
}

} // namespace corpus

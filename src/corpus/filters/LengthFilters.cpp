#include "LengthFilters.hpp"
#include "text/TextUtils.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace corpus
{

namespace
{

LengthFunction orCharLength(LengthFunction fn)
{
    if (fn)
        return fn;
    return &text::charLength;
}

void validateBounds(const LengthBounds& bounds, const char* side)
{
    if (bounds.min && bounds.max && *bounds.min > *bounds.max)
        throw std::invalid_argument(std::string("length bounds: ") + side + " min is greater than max");
}

void validateRatio(double ratio, const char* filter)
{
    if (!std::isfinite(ratio) || ratio <= 0.0)
        throw std::invalid_argument(std::string(filter) + ": ratio must be a positive number");
}

} // namespace

bool LengthBounds::contains(std::size_t length) const
{
    if (min && length < *min)
        return false;
    if (max && length > *max)
        return false;
    return true;
}

bool withinRatio(std::size_t a, std::size_t b, double ratio)
{
    const double da = static_cast<double>(a);
    const double db = static_cast<double>(b);
    return da <= ratio * db && db <= ratio * da;
}

LenFilter::LenFilter(LengthBounds src_lens, LengthBounds tgt_lens, LengthFunction src_len_fn,
                     LengthFunction tgt_len_fn)
    : src_lens_(src_lens)
    , tgt_lens_(tgt_lens)
    , src_len_fn_(orCharLength(std::move(src_len_fn)))
    , tgt_len_fn_(orCharLength(std::move(tgt_len_fn)))
{
    validateBounds(src_lens_, "source");
    validateBounds(tgt_lens_, "target");
}

std::optional<SentencePair> LenFilter::filter(const SentencePair& pair) const
{
    if (!src_lens_.contains(src_len_fn_(pair.source)))
        return std::nullopt;
    if (!tgt_lens_.contains(tgt_len_fn_(pair.target)))
        return std::nullopt;
    return pair;
}

LengthFilter::LengthFilter(LengthFunction src_len_fn, LengthFunction tgt_len_fn, LengthBounds src_lens,
                           LengthBounds tgt_lens, double ratio)
    : bounds_(src_lens, tgt_lens, src_len_fn, tgt_len_fn)
    , src_len_fn_(orCharLength(std::move(src_len_fn)))
    , tgt_len_fn_(orCharLength(std::move(tgt_len_fn)))
    , ratio_(ratio)
{
    validateRatio(ratio_, "length");
}

std::optional<SentencePair> LengthFilter::filter(const SentencePair& pair) const
{
    if (!bounds_.filter(pair))
        return std::nullopt;

    if (!withinRatio(src_len_fn_(pair.source), tgt_len_fn_(pair.target), ratio_))
        return std::nullopt;
    return pair;
}

LenDiffFilter::LenDiffFilter(double ratio, LengthFunction src_len_fn, LengthFunction tgt_len_fn)
    : ratio_(ratio)
    , src_len_fn_(orCharLength(std::move(src_len_fn)))
    , tgt_len_fn_(orCharLength(std::move(tgt_len_fn)))
{
    validateRatio(ratio_, "len_diff");
}

std::optional<SentencePair> LenDiffFilter::filter(const SentencePair& pair) const
{
    if (withinRatio(src_len_fn_(pair.source), tgt_len_fn_(pair.target), ratio_))
        return pair;
    return std::nullopt;
}

LongWordFilter::LongWordFilter(std::optional<std::size_t> src_max_len, std::optional<std::size_t> tgt_max_len)
    : src_max_len_(src_max_len)
    , tgt_max_len_(tgt_max_len)
{
}

std::size_t LongWordFilter::longestWord(const std::string& s)
{
    std::size_t longest = 0;
    for (const auto& word : text::splitWhitespace(s))
    {
        longest = std::max(longest, text::charLength(word));
    }
    return longest;
}

std::optional<SentencePair> LongWordFilter::filter(const SentencePair& pair) const
{
    if (src_max_len_ && longestWord(pair.source) > *src_max_len_)
        return std::nullopt;
    if (tgt_max_len_ && longestWord(pair.target) > *tgt_max_len_)
        return std::nullopt;
    return pair;
}

} // namespace corpus

#include "Hant2Hans.hpp"
#include "text/ChineseConverter.hpp"

namespace corpus
{

Hant2Hans::Hant2Hans(bool norm_src, bool norm_tgt)
    : norm_src_(norm_src)
    , norm_tgt_(norm_tgt)
{
    if (norm_src_ || norm_tgt_)
        text::ensureHantToHansAvailable();
}

SentencePair Hant2Hans::normalize(const SentencePair& pair) const
{
    if (!norm_src_ && !norm_tgt_)
        return pair;

    SentencePair out = pair;
    if (norm_src_)
        out.source = text::hantToHans(pair.source);
    if (norm_tgt_)
        out.target = text::hantToHans(pair.target);
    return out;
}

} // namespace corpus

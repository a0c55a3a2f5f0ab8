#include "NoPrintNormalizer.hpp"

namespace corpus
{

namespace
{

bool isNonPrinting(unsigned char c)
{
    return (c <= 0x08u) || (c >= 0x0Au && c <= 0x1Fu) || c == 0x7Fu;
}

} // namespace

std::string NoPrintNormalizer::normalize(const std::string& s) const
{
    // all removed code points are single bytes that never appear inside a UTF-8 sequence
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        if (!isNonPrinting(static_cast<unsigned char>(c)))
            out.push_back(c);
    }
    return out;
}

SentencePair NoPrintNormalizer::normalize(const SentencePair& pair) const
{
    return SentencePair{ normalize(pair.source), normalize(pair.target) };
}

} // namespace corpus

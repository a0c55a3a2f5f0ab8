#include "SpaceNormalizer.hpp"
#include "text/TextUtils.hpp"

namespace corpus
{

namespace
{

std::u32string trimmed(const std::u32string& s)
{
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && text::isWhitespace(s[begin]))
        ++begin;
    while (end > begin && text::isWhitespace(s[end - 1]))
        --end;
    return s.substr(begin, end - begin);
}

} // namespace

std::string SpaceNormalizer::normalize(const std::string& s) const
{
    std::u32string cps = trimmed(text::utf8ToUtf32(s));

    for (char32_t& cp : cps)
    {
        if (cp == U'\u3000' || cp == U'\u00A0')
            cp = U' ';
    }

    std::u32string collapsed;
    collapsed.reserve(cps.size());
    for (std::size_t i = 0; i < cps.size();)
    {
        if (!text::isWhitespace(cps[i]))
        {
            collapsed.push_back(cps[i++]);
            continue;
        }
        std::size_t run_end = i;
        while (run_end < cps.size() && text::isWhitespace(cps[run_end]))
            ++run_end;
        collapsed.push_back(run_end - i >= 2 ? U' ' : cps[i]);
        i = run_end;
    }
    collapsed = trimmed(collapsed);

    // neighbours are looked up in `collapsed`, before any space is dropped
    std::u32string out;
    out.reserve(collapsed.size());
    const std::size_t n = collapsed.size();
    for (std::size_t i = 0; i < n; ++i)
    {
        const char32_t cp = collapsed[i];
        if (cp == U' ' && ((i > 0 && !text::isAsciiChar(collapsed[i - 1])) ||
                           (i + 1 < n && !text::isAsciiChar(collapsed[i + 1]))))
        {
            continue;
        }
        out.push_back(cp);
    }

    return text::utf32ToUtf8(out);
}

SentencePair SpaceNormalizer::normalize(const SentencePair& pair) const
{
    return SentencePair{ normalize(pair.source), normalize(pair.target) };
}

} // namespace corpus

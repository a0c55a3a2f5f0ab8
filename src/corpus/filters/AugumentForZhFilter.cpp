#include "AugumentForZhFilter.hpp"

namespace corpus
{

namespace
{

bool isLatinWordByte(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

} // namespace

std::vector<std::string> AugumentForZhFilter::latinWords(const std::string& s)
{
    // ASCII bytes never occur inside multi-byte UTF-8 sequences
    std::vector<std::string> words;
    std::size_t i = 0;
    while (i < s.size())
    {
        if (!isLatinWordByte(s[i]))
        {
            ++i;
            continue;
        }
        std::size_t start = i;
        while (i < s.size() && isLatinWordByte(s[i]))
            ++i;
        words.emplace_back(s, start, i - start);
    }
    return words;
}

bool AugumentForZhFilter::allPresent(const std::vector<std::string>& words, const std::string& s)
{
    for (const auto& word : words)
    {
        if (s.find(word) == std::string::npos)
            return false;
    }
    return true;
}

std::optional<SentencePair> AugumentForZhFilter::filter(const SentencePair& pair) const
{
    if (!allPresent(latinWords(pair.source), pair.target))
        return std::nullopt;
    if (!allPresent(latinWords(pair.target), pair.source))
        return std::nullopt;
    return pair;
}

} // namespace corpus

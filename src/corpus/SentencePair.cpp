#include "SentencePair.hpp"

namespace corpus
{

std::optional<SentencePair> TabPairCodec::decode(std::string_view line)
{
    std::size_t tab = line.find(kDelimiter);
    if (tab == std::string_view::npos)
        return std::nullopt;
    if (line.find(kDelimiter, tab + 1) != std::string_view::npos)
        return std::nullopt;

    return SentencePair{ std::string(line.substr(0, tab)), std::string(line.substr(tab + 1)) };
}

std::string TabPairCodec::encode(const SentencePair& pair)
{
    std::string out;
    out.reserve(pair.source.size() + pair.target.size() + 1);
    out += pair.source;
    out += kDelimiter;
    out += pair.target;
    return out;
}

} // namespace corpus

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace corpus
{

// One aligned (source, target) sentence pair, UTF-8 encoded.
struct SentencePair
{
    std::string source;
    std::string target;

    bool operator==(const SentencePair& other) const
    {
        return source == other.source && target == other.target;
    }
    bool operator!=(const SentencePair& other) const { return !(*this == other); }
};

// "src\ttgt" serialization used by single-stream corpora.
class TabPairCodec
{
public:
    static constexpr char kDelimiter = '\t';

    // std::nullopt unless the line splits into exactly two fields
    [[nodiscard]] static std::optional<SentencePair> decode(std::string_view line);

    [[nodiscard]] static std::string encode(const SentencePair& pair);
};

} // namespace corpus

#pragma once

#include "../IFilter.hpp"

#include <vector>

namespace corpus
{

/**
 * @brief Keeps Latin words and numbers aligned across a Chinese pair.
 *
 * Every [A-Za-z0-9]+ run of one side must occur verbatim somewhere in the
 * other side, checked in both directions.
 */
class AugumentForZhFilter final : public IFilter
{
public:
    [[nodiscard]] std::optional<SentencePair> filter(const SentencePair& pair) const override;
    [[nodiscard]] std::string name() const override { return "augument_for_zh"; }

    [[nodiscard]] static std::vector<std::string> latinWords(const std::string& s);

private:
    [[nodiscard]] static bool allPresent(const std::vector<std::string>& words, const std::string& s);
};

} // namespace corpus

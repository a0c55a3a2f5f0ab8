#pragma once

#include "../IFilter.hpp"

#include <array>
#include <optional>
#include <vector>

#include <unicode/uscript.h>

namespace corpus
{

/**
 * @brief Proportion of alphabetic characters in the segment.
 *
 * Both sides must score at least `threshold`. With exclude_whitespace the
 * denominator ignores whitespace. A side with an empty denominator is rejected.
 */
class AlphabetRatioFilter final : public IFilter
{
public:
    explicit AlphabetRatioFilter(double threshold = 0.75, bool exclude_whitespace = false);

    [[nodiscard]] std::optional<SentencePair> filter(const SentencePair& pair) const override;
    [[nodiscard]] std::string name() const override { return "alphabet_ratio"; }

    [[nodiscard]] std::optional<double> score(const std::string& s) const;

private:
    double threshold_;
    bool exclude_whitespace_;
};

/**
 * @brief Proportion of alphabetic characters that are in the expected script.
 *
 * `scripts` holds one entry per side, each a language code known to
 * text::languageScripts() ("zh", "en", ...) or an ICU Script property value
 * name ("Han", "Latin", "Hang", ...). A side without alphabetic characters is
 * rejected. Japanese has no entry: kana would count against "Han" and sink
 * nearly every real sentence below the threshold.
 *
 * @throws std::invalid_argument on an unknown script, a thresholds/scripts
 * count mismatch or a threshold outside [0, 1]
 */
class CharacterRatioFilter final : public IFilter
{
public:
    explicit CharacterRatioFilter(const std::vector<std::string>& scripts, std::vector<double> thresholds = {});

    [[nodiscard]] std::optional<SentencePair> filter(const SentencePair& pair) const override;
    [[nodiscard]] std::string name() const override { return "character_ratio"; }

    // side 0 is the source, 1 the target
    [[nodiscard]] std::optional<double> score(const std::string& sentence, std::size_t side) const;

private:
    std::array<UScriptCode, 2> scripts_{};
    std::array<double, 2> thresholds_{};
};

} // namespace corpus

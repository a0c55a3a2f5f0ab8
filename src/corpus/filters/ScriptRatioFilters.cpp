#include "ScriptRatioFilters.hpp"
#include "text/TextUtils.hpp"
#include "text/UnicodeScripts.hpp"

#include <cmath>
#include <stdexcept>

namespace corpus
{

namespace
{

void validateThreshold(double threshold, const std::string& filter)
{
    if (!std::isfinite(threshold) || threshold < 0.0 || threshold > 1.0)
        throw std::invalid_argument(filter + ": threshold must be within [0, 1]");
}

} // namespace

AlphabetRatioFilter::AlphabetRatioFilter(double threshold, bool exclude_whitespace)
    : threshold_(threshold)
    , exclude_whitespace_(exclude_whitespace)
{
    validateThreshold(threshold_, name());
}

std::optional<double> AlphabetRatioFilter::score(const std::string& s) const
{
    std::size_t segment = 0;
    std::size_t alphas = 0;
    for (char32_t cp : text::utf8ToUtf32(s))
    {
        if (exclude_whitespace_ && text::isWhitespace(cp))
            continue;
        ++segment;
        if (text::isAlphabetic(cp))
            ++alphas;
    }

    if (segment == 0)
        return std::nullopt;
    return static_cast<double>(alphas) / static_cast<double>(segment);
}

std::optional<SentencePair> AlphabetRatioFilter::filter(const SentencePair& pair) const
{
    auto src_score = score(pair.source);
    if (!src_score || *src_score < threshold_)
        return std::nullopt;

    auto tgt_score = score(pair.target);
    if (!tgt_score || *tgt_score < threshold_)
        return std::nullopt;

    return pair;
}

CharacterRatioFilter::CharacterRatioFilter(const std::vector<std::string>& scripts, std::vector<double> thresholds)
{
    if (scripts.size() != 2)
        throw std::invalid_argument("character_ratio: expected one script for the source and one for the target");

    if (thresholds.empty())
        thresholds.assign(scripts.size(), 1.0);
    if (thresholds.size() != scripts.size())
        throw std::invalid_argument("character_ratio: thresholds count does not match scripts count");

    for (std::size_t i = 0; i < scripts.size(); ++i)
    {
        auto code = text::resolveScript(scripts[i]);
        if (!code)
            throw std::invalid_argument("character_ratio: unknown script '" + scripts[i] + "'");
        validateThreshold(thresholds[i], name());

        scripts_[i] = *code;
        thresholds_[i] = thresholds[i];
    }
}

std::optional<double> CharacterRatioFilter::score(const std::string& sentence, std::size_t side) const
{
    std::size_t alphas = 0;
    std::size_t in_script = 0;
    for (char32_t cp : text::utf8ToUtf32(sentence))
    {
        if (!text::isAlphabetic(cp))
            continue;
        ++alphas;
        if (text::scriptOf(cp) == scripts_.at(side))
            ++in_script;
    }

    if (alphas == 0)
        return std::nullopt;
    return static_cast<double>(in_script) / static_cast<double>(alphas);
}

std::optional<SentencePair> CharacterRatioFilter::filter(const SentencePair& pair) const
{
    auto src_score = score(pair.source, 0);
    if (!src_score || *src_score < thresholds_[0])
        return std::nullopt;

    auto tgt_score = score(pair.target, 1);
    if (!tgt_score || *tgt_score < thresholds_[1])
        return std::nullopt;

    return pair;
}

} // namespace corpus

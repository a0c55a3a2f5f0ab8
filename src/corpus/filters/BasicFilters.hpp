#pragma once

#include "../IFilter.hpp"

namespace corpus
{

// Rejects pairs whose trimmed source and target are equal
class SameFilter final : public IFilter
{
public:
    explicit SameFilter(bool lower = true);

    [[nodiscard]] std::optional<SentencePair> filter(const SentencePair& pair) const override;
    [[nodiscard]] std::string name() const override { return "same"; }

private:
    bool lower_;
};

// Rejects pairs whose checked side contains Chinese characters
class HasZhFilter final : public IFilter
{
public:
    explicit HasZhFilter(bool filter_src = true);

    [[nodiscard]] std::optional<SentencePair> filter(const SentencePair& pair) const override;
    [[nodiscard]] std::string name() const override { return "has_zh"; }

private:
    bool filter_src_;
};

// Rejects pairs with a side that is empty after trimming
class EmptyFilter final : public IFilter
{
public:
    [[nodiscard]] std::optional<SentencePair> filter(const SentencePair& pair) const override;
    [[nodiscard]] std::string name() const override { return "empty"; }
};

// Rejects pairs where both sides are plain ASCII
class AllASCII final : public IFilter
{
public:
    [[nodiscard]] std::optional<SentencePair> filter(const SentencePair& pair) const override;
    [[nodiscard]] std::string name() const override { return "all_ascii"; }
};

/**
 * @brief Rejects pairs where a checked side has an ASCII fraction above threshold.
 *
 * The fraction is counted over code points. An empty checked side is rejected.
 */
class ASCIIRatioFilter final : public IFilter
{
public:
    explicit ASCIIRatioFilter(double threshold = 0.67, bool filter_src = false, bool filter_tgt = true);

    [[nodiscard]] std::optional<SentencePair> filter(const SentencePair& pair) const override;
    [[nodiscard]] std::string name() const override { return "ascii_ratio"; }

    // Fraction of ASCII code points, std::nullopt for an empty string
    [[nodiscard]] static std::optional<double> score(const std::string& s);

private:
    [[nodiscard]] bool tooMuchAscii(const std::string& s) const;

    double threshold_;
    bool filter_src_;
    bool filter_tgt_;
};

} // namespace corpus

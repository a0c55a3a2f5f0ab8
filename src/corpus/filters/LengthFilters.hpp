#pragma once

#include "../IFilter.hpp"

#include <cstddef>
#include <functional>
#include <optional>

namespace corpus
{

// Measures a sentence; see text::charLength and text::spaceSeparatedLength
using LengthFunction = std::function<std::size_t(const std::string&)>;

// Inclusive length bounds, either end optional
struct LengthBounds
{
    std::optional<std::size_t> min;
    std::optional<std::size_t> max;

    [[nodiscard]] bool contains(std::size_t length) const;
};

// Rejects pairs with a side whose length falls outside its bounds
class LenFilter final : public IFilter
{
public:
    LenFilter(LengthBounds src_lens = {}, LengthBounds tgt_lens = {}, LengthFunction src_len_fn = {},
              LengthFunction tgt_len_fn = {});

    [[nodiscard]] std::optional<SentencePair> filter(const SentencePair& pair) const override;
    [[nodiscard]] std::string name() const override { return "len"; }

private:
    LengthBounds src_lens_;
    LengthBounds tgt_lens_;
    LengthFunction src_len_fn_;
    LengthFunction tgt_len_fn_;
};

/**
 * @brief Length bounds plus a symmetric length ratio.
 *
 * A pair is kept only if both sides are within bounds and
 * src_len <= ratio * tgt_len and tgt_len <= ratio * src_len.
 */
class LengthFilter final : public IFilter
{
public:
    LengthFilter(LengthFunction src_len_fn = {}, LengthFunction tgt_len_fn = {}, LengthBounds src_lens = {},
                 LengthBounds tgt_lens = {}, double ratio = 3.0);

    [[nodiscard]] std::optional<SentencePair> filter(const SentencePair& pair) const override;
    [[nodiscard]] std::string name() const override { return "length"; }

private:
    LenFilter bounds_;
    LengthFunction src_len_fn_;
    LengthFunction tgt_len_fn_;
    double ratio_;
};

// Rejects pairs whose lengths differ by more than `ratio` in either direction
class LenDiffFilter final : public IFilter
{
public:
    explicit LenDiffFilter(double ratio, LengthFunction src_len_fn = {}, LengthFunction tgt_len_fn = {});

    [[nodiscard]] std::optional<SentencePair> filter(const SentencePair& pair) const override;
    [[nodiscard]] std::string name() const override { return "len_diff"; }

private:
    double ratio_;
    LengthFunction src_len_fn_;
    LengthFunction tgt_len_fn_;
};

// For languages that use spaces between words: rejects overlong tokens
class LongWordFilter final : public IFilter
{
public:
    explicit LongWordFilter(std::optional<std::size_t> src_max_len = 40, std::optional<std::size_t> tgt_max_len = 40);

    [[nodiscard]] std::optional<SentencePair> filter(const SentencePair& pair) const override;
    [[nodiscard]] std::string name() const override { return "long_word"; }

    // Code point length of the longest whitespace delimited token, 0 if none
    [[nodiscard]] static std::size_t longestWord(const std::string& s);

private:
    std::optional<std::size_t> src_max_len_;
    std::optional<std::size_t> tgt_max_len_;
};

// Shared by the ratio based filters
[[nodiscard]] bool withinRatio(std::size_t a, std::size_t b, double ratio);

} // namespace corpus

#pragma once

#include "../INormalizer.hpp"

namespace corpus
{

/**
 * @brief Traditional Chinese to Simplified Chinese.
 *
 * @throws std::runtime_error from the constructor when the ICU transform is
 * unavailable and at least one side is enabled
 */
class Hant2Hans final : public INormalizer
{
public:
    explicit Hant2Hans(bool norm_src = true, bool norm_tgt = true);

    [[nodiscard]] SentencePair normalize(const SentencePair& pair) const override;
    [[nodiscard]] std::string name() const override { return "hant2hans"; }

private:
    bool norm_src_;
    bool norm_tgt_;
};

} // namespace corpus

#pragma once

#include "../INormalizer.hpp"

namespace corpus
{

// Removes C0 control characters except tab, and DEL
class NoPrintNormalizer final : public INormalizer
{
public:
    [[nodiscard]] std::string normalize(const std::string& s) const;
    [[nodiscard]] SentencePair normalize(const SentencePair& pair) const override;
    [[nodiscard]] std::string name() const override { return "no_print"; }
};

} // namespace corpus

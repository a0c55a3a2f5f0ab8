#pragma once

#include "../IFilter.hpp"
#include "text/LanguageDetector.hpp"

#include <memory>

namespace corpus
{

// Rejects pairs where a side is not detected as the expected language
class LangFilter final : public IFilter
{
public:
    // A null detector falls back to text::ScriptLanguageDetector
    LangFilter(std::string src_lang, std::string tgt_lang,
               std::shared_ptr<const text::ILanguageDetector> detector = nullptr);

    [[nodiscard]] std::optional<SentencePair> filter(const SentencePair& pair) const override;
    [[nodiscard]] std::string name() const override { return "lang"; }

private:
    std::string src_lang_;
    std::string tgt_lang_;
    std::shared_ptr<const text::ILanguageDetector> detector_;
};

} // namespace corpus

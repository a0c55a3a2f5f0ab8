#pragma once

#include <string>

namespace text
{

/**
 * @brief Language identification collaborator used by LangFilter.
 *
 * Implementations must be stateless after construction and return a stable
 * ISO 639-1 style code for a given text ("en", "zh", ...).
 */
class ILanguageDetector
{
public:
    virtual ~ILanguageDetector() = default;

    [[nodiscard]] virtual std::string detect(const std::string& text) const = 0;
};

/**
 * @brief Detects the language from the dominant Unicode script of the letters.
 *
 * Han text containing kana is reported as "ja". Latin text is reported as
 * "en", Cyrillic as "ru". Text without letters yields kUndetermined.
 */
class ScriptLanguageDetector final : public ILanguageDetector
{
public:
    static constexpr const char* kUndetermined = "und";

    [[nodiscard]] std::string detect(const std::string& text) const override;
};

} // namespace text

#include "UnicodeScripts.hpp"

#include <unicode/uchar.h>

namespace text
{

const std::map<std::string, std::string>& languageScripts()
{
    static const std::map<std::string, std::string> kScripts = {
        { "zh", "Han" },
        { "en", "Latin" },
        { "ko", "Hangul" },
        { "ar", "Arabic" },
        { "th", "Thai" },
        { "ru", "Cyrillic" },
    };
    return kScripts;
}

std::optional<UScriptCode> resolveScript(std::string_view name)
{
    std::string key(name);
    const auto& scripts = languageScripts();
    if (auto it = scripts.find(key); it != scripts.end())
    {
        key = it->second;
    }

    int32_t value = u_getPropertyValueEnum(UCHAR_SCRIPT, key.c_str());
    if (value == UCHAR_INVALID_CODE)
        return std::nullopt;
    return static_cast<UScriptCode>(value);
}

UScriptCode scriptOf(char32_t cp)
{
    UErrorCode err = U_ZERO_ERROR;
    UScriptCode script = uscript_getScript(static_cast<UChar32>(cp), &err);
    if (U_FAILURE(err))
        return USCRIPT_INVALID_CODE;
    return script;
}

bool isAlphabetic(char32_t cp)
{
    return u_hasBinaryProperty(static_cast<UChar32>(cp), UCHAR_ALPHABETIC) != 0;
}

} // namespace text

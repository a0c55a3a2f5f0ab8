#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <unicode/uscript.h>

namespace text
{

/// Language code -> Unicode Script property value used by the script ratio filters.
/// Only languages written in one script are listed; Japanese mixes Han and kana.
const std::map<std::string, std::string>& languageScripts();

/**
 * @brief Resolves a language code ("zh") or a Script property value name
 * ("Han", "Hani", "Latin") to an ICU script code.
 *
 * @return std::nullopt when neither lookup succeeds
 */
[[nodiscard]] std::optional<UScriptCode> resolveScript(std::string_view name);

[[nodiscard]] UScriptCode scriptOf(char32_t cp);

/// Unicode Alphabetic derived property
[[nodiscard]] bool isAlphabetic(char32_t cp);

} // namespace text

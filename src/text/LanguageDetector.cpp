#include "LanguageDetector.hpp"
#include "TextUtils.hpp"
#include "UnicodeScripts.hpp"

#include <array>
#include <map>

namespace text
{

namespace
{

struct ScriptLanguage
{
    UScriptCode script;
    const char* language;
};

constexpr std::array<ScriptLanguage, 10> kScriptLanguages = { {
    { USCRIPT_HAN, "zh" },
    { USCRIPT_HIRAGANA, "ja" },
    { USCRIPT_KATAKANA, "ja" },
    { USCRIPT_HANGUL, "ko" },
    { USCRIPT_LATIN, "en" },
    { USCRIPT_CYRILLIC, "ru" },
    { USCRIPT_ARABIC, "ar" },
    { USCRIPT_THAI, "th" },
    { USCRIPT_GREEK, "el" },
    { USCRIPT_HEBREW, "he" },
} };

const char* languageFor(UScriptCode script)
{
    if (script == USCRIPT_DEVANAGARI)
        return "hi";
    for (const auto& entry : kScriptLanguages)
    {
        if (entry.script == script)
            return entry.language;
    }
    return nullptr;
}

} // namespace

std::string ScriptLanguageDetector::detect(const std::string& text) const
{
    std::map<std::string, std::size_t> votes;
    bool has_kana = false;

    for (char32_t cp : utf8ToUtf32(text))
    {
        if (!isAlphabetic(cp))
            continue;
        UScriptCode script = scriptOf(cp);
        if (script == USCRIPT_HIRAGANA || script == USCRIPT_KATAKANA)
            has_kana = true;
        if (const char* lang = languageFor(script))
            ++votes[lang];
    }

    if (votes.empty())
        return kUndetermined;

    // Kanji outnumber kana in most Japanese sentences
    if (has_kana)
    {
        votes["ja"] += votes["zh"];
        votes.erase("zh");
    }

    auto best = votes.begin();
    for (auto it = votes.begin(); it != votes.end(); ++it)
    {
        if (it->second > best->second)
            best = it;
    }
    return best->first;
}

} // namespace text

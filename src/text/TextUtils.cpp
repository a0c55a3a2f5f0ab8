#include "TextUtils.hpp"
#include <utf8proc.h>

#include <utility>

namespace text
{

std::u32string utf8ToUtf32(std::string_view utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    result.reserve(utf8_str.size());
    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.data());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            // skip one byte of a broken sequence and keep going
            result.push_back(U'\uFFFD');
            ++pos;
            continue;
        }
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    result.reserve(utf32_str.size());
    for (char32_t cp : utf32_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

bool isAsciiChar(char32_t cp)
{
    return cp < 0x80u;
}

bool isAscii(std::string_view s)
{
    // UTF-8 lead and continuation bytes all have the high bit set
    for (char c : s)
    {
        if (static_cast<unsigned char>(c) >= 0x80u)
            return false;
    }
    return true;
}

std::size_t countAscii(std::string_view s)
{
    std::size_t n = 0;
    for (char c : s)
    {
        if (static_cast<unsigned char>(c) < 0x80u)
            ++n;
    }
    return n;
}

bool isCjkUnified(char32_t cp)
{
    return (cp >= 0x4E00u && cp <= 0x9FFFu) ||
           (cp >= 0x3400u && cp <= 0x4DBFu) ||
           (cp >= 0x20000u && cp <= 0x2A6DFu);
}

bool hasZh(std::string_view s)
{
    for (char32_t cp : utf8ToUtf32(s))
    {
        if (isCjkUnified(cp))
            return true;
    }
    return false;
}

bool isWhitespace(char32_t cp)
{
    if (cp == U'\t' || cp == U'\n' || cp == U'\v' || cp == U'\f' || cp == U'\r' || cp == U' ')
        return true;
    if (cp < 0x80u && !(cp >= 0x1Cu && cp <= 0x1Fu))
        return false;

    const utf8proc_property_t* prop = utf8proc_get_property(static_cast<utf8proc_int32_t>(cp));
    if (prop->category == UTF8PROC_CATEGORY_ZS)
        return true;
    return prop->bidi_class == UTF8PROC_BIDI_CLASS_WS || prop->bidi_class == UTF8PROC_BIDI_CLASS_B ||
           prop->bidi_class == UTF8PROC_BIDI_CLASS_S;
}

std::string trim(std::string_view s)
{
    std::u32string cps = utf8ToUtf32(s);
    std::size_t begin = 0;
    std::size_t end = cps.size();
    while (begin < end && isWhitespace(cps[begin]))
        ++begin;
    while (end > begin && isWhitespace(cps[end - 1]))
        --end;
    return utf32ToUtf8(cps.substr(begin, end - begin));
}

std::string toLower(std::string_view s)
{
    std::u32string cps = utf8ToUtf32(s);
    for (char32_t& cp : cps)
    {
        cp = static_cast<char32_t>(utf8proc_tolower(static_cast<utf8proc_int32_t>(cp)));
    }
    return utf32ToUtf8(cps);
}

std::vector<std::string> splitWhitespace(std::string_view s)
{
    std::vector<std::string> tokens;
    std::u32string current;
    for (char32_t cp : utf8ToUtf32(s))
    {
        if (isWhitespace(cp))
        {
            if (!current.empty())
            {
                tokens.push_back(utf32ToUtf8(current));
                current.clear();
            }
        }
        else
        {
            current.push_back(cp);
        }
    }
    if (!current.empty())
        tokens.push_back(utf32ToUtf8(current));
    return tokens;
}

std::size_t charLength(const std::string& s)
{
    return utf8ToUtf32(s).size();
}

std::size_t spaceSeparatedLength(const std::string& s)
{
    return splitWhitespace(s).size();
}

void replaceAll(std::string& s, std::string_view from, std::string_view to)
{
    if (from.empty())
        return;

    std::string out;
    out.reserve(s.size());
    std::size_t pos = 0;
    while (true)
    {
        std::size_t hit = s.find(from, pos);
        if (hit == std::string::npos)
            break;
        out.append(s, pos, hit - pos);
        out.append(to);
        pos = hit + from.size();
    }
    out.append(s, pos, std::string::npos);
    s = std::move(out);
}

} // namespace text

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace text
{

/// UTF-8 to UTF-32 conversion. Invalid sequences decode to U+FFFD.
std::u32string utf8ToUtf32(std::string_view utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

[[nodiscard]] bool isAsciiChar(char32_t cp);

/// True when every code point of the string is ASCII (an empty string is ASCII)
[[nodiscard]] bool isAscii(std::string_view s);

/// Number of ASCII code points in the string
[[nodiscard]] std::size_t countAscii(std::string_view s);

/// CJK Unified Ideographs, including extensions A and B
[[nodiscard]] bool isCjkUnified(char32_t cp);

[[nodiscard]] bool hasZh(std::string_view s);

/// Whitespace in the sense of a Unicode-aware str.isspace(): bidi classes WS, B, S or category Zs
[[nodiscard]] bool isWhitespace(char32_t cp);

/// Strips leading and trailing whitespace
[[nodiscard]] std::string trim(std::string_view s);

/// Simple (one to one) lower-case mapping of every code point
[[nodiscard]] std::string toLower(std::string_view s);

/// Splits on runs of whitespace, dropping empty tokens
[[nodiscard]] std::vector<std::string> splitWhitespace(std::string_view s);

/// Length functions used by the length filters
[[nodiscard]] std::size_t charLength(const std::string& s);
[[nodiscard]] std::size_t spaceSeparatedLength(const std::string& s);

/// Replaces every occurrence of `from` (non-empty) in `s`, scanning left to right
void replaceAll(std::string& s, std::string_view from, std::string_view to);

} // namespace text

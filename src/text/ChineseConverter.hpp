#pragma once

#include <string>
#include <string_view>

namespace text
{

/// ICU transform used for Traditional -> Simplified conversion
inline constexpr const char* kHantToHansTransform = "Traditional-Simplified";

/**
 * @brief Converts Traditional Chinese characters to Simplified Chinese.
 *
 * Each calling thread owns its own transliterator, created on first use, so the
 * function can be called concurrently.
 *
 * @throws std::runtime_error when ICU cannot create the transform
 */
[[nodiscard]] std::string hantToHans(std::string_view text);

/// Creates the transform once on the calling thread; throws like hantToHans()
void ensureHantToHansAvailable();

} // namespace text

#pragma once

#include "SentencePair.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

#include <toml++/toml.h>

namespace corpus
{

/**
 * @brief Per-pair tracing of the cleaning stages.
 *
 * Rejections, rewrites and malformed lines are logged on the plog instance
 * kLogInstance. Rejections and rewrites only when verbose is on, since a
 * corpus run touches millions of pairs.
 */
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    // [diagnostics] table
    struct Settings
    {
        bool verbose = false;
        std::size_t max_preview = 160; // bytes of each side shown in a log line
    };

    // throws std::invalid_argument for a max_preview below 1
    [[nodiscard]] static Settings ParseSettings(const toml::table& section);

    static void Apply(const Settings& settings) noexcept;
    [[nodiscard]] static Settings Current() noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    // Escapes tabs and line breaks, cuts at max_preview on a UTF-8 boundary
    [[nodiscard]] static std::string Preview(std::string_view text);

    // "src=<preview> tgt=<preview>"
    [[nodiscard]] static std::string PreviewPair(const SentencePair& pair);

private:
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace corpus

#include "Diagnostics.hpp"

#include <algorithm>
#include <stdexcept>

namespace corpus
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };

Diagnostics::Settings Diagnostics::ParseSettings(const toml::table& section)
{
    Settings settings;
    if (auto node = section["verbose"])
    {
        auto verbose = node.value_exact<bool>();
        if (!verbose)
            throw std::invalid_argument("verbose must be a boolean");
        settings.verbose = *verbose;
    }
    if (auto node = section["max_preview"])
    {
        auto preview = node.value_exact<int64_t>();
        if (!preview || *preview < 1)
            throw std::invalid_argument("max_preview must be a positive integer");
        settings.max_preview = static_cast<std::size_t>(*preview);
    }
    return settings;
}

void Diagnostics::Apply(const Settings& settings) noexcept
{
    verbose_.store(settings.verbose, std::memory_order_relaxed);
    max_preview_.store(std::max<std::size_t>(settings.max_preview, 1), std::memory_order_relaxed);
}

Diagnostics::Settings Diagnostics::Current() noexcept
{
    return Settings{ verbose_.load(std::memory_order_relaxed), max_preview_.load(std::memory_order_relaxed) };
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    std::size_t limit = std::min(text.size(), max_preview_.load(std::memory_order_relaxed));
    while (limit > 0 && limit < text.size() && (static_cast<unsigned char>(text[limit]) & 0xC0u) == 0x80u)
        --limit;

    std::string out;
    out.reserve(limit + 24);
    for (char ch : text.substr(0, limit))
    {
        const auto byte = static_cast<unsigned char>(ch);
        if (ch == '\t')
            out += "\\t";
        else if (ch == '\n')
            out += "\\n";
        else if (ch == '\r')
            out += "\\r";
        else if (byte < 0x20 || byte == 0x7F)
            out.push_back('?');
        else
            out.push_back(ch);
    }

    if (text.size() > limit)
        out += "... (" + std::to_string(text.size()) + " bytes)";
    return out;
}

std::string Diagnostics::PreviewPair(const SentencePair& pair)
{
    return "src=" + Preview(pair.source) + " tgt=" + Preview(pair.target);
}

} // namespace corpus

#include "LangFilter.hpp"
#include "../Diagnostics.hpp"

#include <plog/Log.h>

#include <stdexcept>
#include <utility>

namespace corpus
{

LangFilter::LangFilter(std::string src_lang, std::string tgt_lang,
                       std::shared_ptr<const text::ILanguageDetector> detector)
    : src_lang_(std::move(src_lang))
    , tgt_lang_(std::move(tgt_lang))
    , detector_(std::move(detector))
{
    if (src_lang_.empty() || tgt_lang_.empty())
        throw std::invalid_argument("lang: src_lang and tgt_lang are required");
    if (!detector_)
        detector_ = std::make_shared<text::ScriptLanguageDetector>();
}

std::optional<SentencePair> LangFilter::filter(const SentencePair& pair) const
{
    const std::string src_detected = detector_->detect(pair.source);
    if (src_detected != src_lang_)
    {
        if (Diagnostics::IsVerbose())
            PLOG_DEBUG_(Diagnostics::kLogInstance)
                << "[lang] source detected=" << src_detected << " expected=" << src_lang_;
        return std::nullopt;
    }

    const std::string tgt_detected = detector_->detect(pair.target);
    if (tgt_detected != tgt_lang_)
    {
        if (Diagnostics::IsVerbose())
            PLOG_DEBUG_(Diagnostics::kLogInstance)
                << "[lang] target detected=" << tgt_detected << " expected=" << tgt_lang_;
        return std::nullopt;
    }

    return pair;
}

} // namespace corpus

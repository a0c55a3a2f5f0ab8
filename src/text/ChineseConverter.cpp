#include "ChineseConverter.hpp"

#include <memory>
#include <stdexcept>

#include <unicode/translit.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

namespace text
{

namespace
{

std::unique_ptr<icu::Transliterator> createTransliterator()
{
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::Transliterator> transliterator(icu::Transliterator::createInstance(
        icu::UnicodeString::fromUTF8(kHantToHansTransform), UTRANS_FORWARD, status));
    if (U_FAILURE(status) || !transliterator)
    {
        throw std::runtime_error(std::string("cannot create ICU transform '") + kHantToHansTransform +
                                 "': " + u_errorName(status));
    }
    return transliterator;
}

const icu::Transliterator& threadTransliterator()
{
    thread_local std::unique_ptr<icu::Transliterator> instance;
    if (!instance)
        instance = createTransliterator();
    return *instance;
}

} // namespace

std::string hantToHans(std::string_view text)
{
    if (text.empty())
        return std::string();

    icu::UnicodeString ustr =
        icu::UnicodeString::fromUTF8(icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
    threadTransliterator().transliterate(ustr);

    std::string out;
    ustr.toUTF8String(out);
    return out;
}

void ensureHantToHansAvailable()
{
    (void)threadTransliterator();
}

} // namespace text

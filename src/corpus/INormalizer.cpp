#include "INormalizer.hpp"
#include "Diagnostics.hpp"

#include <plog/Log.h>

namespace corpus
{

std::string normalizeSerialized(const INormalizer& normalizer, const std::string& line)
{
    auto pair = TabPairCodec::decode(line);
    if (!pair)
    {
        PLOG_WARNING_(Diagnostics::kLogInstance)
            << "[" << normalizer.name() << "] malformed pair line, expected 2 tab separated fields: "
            << Diagnostics::Preview(line);
        return line;
    }

    return TabPairCodec::encode(normalizer.normalize(*pair));
}

} // namespace corpus

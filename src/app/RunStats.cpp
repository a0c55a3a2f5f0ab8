#include "RunStats.hpp"

namespace app
{

void RunStats::record(const corpus::PairOutcome& outcome)
{
    ++read;
    if (outcome.kept())
    {
        ++kept;
        if (outcome.modified)
            ++modified;
    }
    else if (outcome.error)
    {
        ++errors;
    }
    else
    {
        ++rejected[outcome.rejected_by];
    }
}

std::size_t RunStats::rejectedTotal() const
{
    std::size_t total = 0;
    for (const auto& [name, count] : rejected)
        total += count;
    return total;
}

nlohmann::json RunStats::toJson() const
{
    nlohmann::json j;
    j["read"] = read;
    j["kept"] = kept;
    j["modified"] = modified;
    j["malformed"] = malformed;
    j["errors"] = errors;
    j["rejected"] = nlohmann::json::object();
    for (const auto& [name, count] : rejected)
        j["rejected"][name] = count;
    return j;
}

} // namespace app

#pragma once

#include "corpus/Pipeline.hpp"

#include <cstddef>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace app
{

// Counters of one cleaning run
struct RunStats
{
    std::size_t read = 0;
    std::size_t kept = 0;
    std::size_t modified = 0;
    std::size_t malformed = 0; // tab-joined lines without exactly two fields
    std::size_t errors = 0;    // pairs dropped because a stage threw
    std::map<std::string, std::size_t> rejected;

    void record(const corpus::PairOutcome& outcome);

    [[nodiscard]] std::size_t rejectedTotal() const;

    [[nodiscard]] nlohmann::json toJson() const;
};

} // namespace app

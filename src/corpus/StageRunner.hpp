#pragma once

#include "Diagnostics.hpp"

#include <exception>
#include <optional>
#include <string>
#include <utility>

#include <plog/Log.h>

namespace corpus
{

// Outcome of one normalizer or filter applied to one pair
template<typename T>
struct StageResult
{
    T result{};
    bool succeeded = true;
    std::optional<std::string> error;
    std::string stage_name;

    static StageResult success(T r, const std::string& name)
    {
        StageResult res;
        res.result = std::move(r);
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, const std::string& name)
    {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.stage_name = name;
        return res;
    }
};

// Runs a stage (callable returning T). An exception fails the stage, not the stream.
template<typename T, typename Fn>
StageResult<T> run_stage(const std::string& stage_name, Fn&& fn)
{
    try
    {
        return StageResult<T>::success(fn(), stage_name);
    }
    catch (const std::exception& ex)
    {
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' failed: " << ex.what();
        return StageResult<T>::failure(ex.what(), stage_name);
    }
}

} // namespace corpus

#pragma once

#include "RunStats.hpp"
#include "corpus/Pipeline.hpp"

#include <cstddef>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

#include <toml++/toml.h>

namespace app
{

// Unreadable or unbalanced input, unwritable output
class IoError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// [runner] table
struct RunnerSettings
{
    static constexpr std::size_t kMaxThreads = 256;

    std::size_t threads = 1;
    std::size_t batch_size = 10000;

    // throws std::invalid_argument for wrongly typed values, threads outside
    // [1, kMaxThreads] and a batch_size below 1
    [[nodiscard]] static RunnerSettings Parse(const toml::table& section);
};

/**
 * @brief Streams a corpus through a Pipeline.
 *
 * Lines are read in batches of batch_size; each batch is split across
 * `threads` workers sharing the const pipeline. Output keeps input order.
 */
class CorpusRunner
{
public:
    CorpusRunner(const corpus::Pipeline& pipeline, RunnerSettings settings);

    // Two aligned streams, one sentence per line
    RunStats runParallel(std::istream& src, std::istream& tgt, std::ostream& out_src, std::ostream& out_tgt) const;

    // One "src\ttgt" stream
    RunStats runTabSeparated(std::istream& in, std::ostream& out) const;

    RunStats runParallelFiles(const std::string& src_path, const std::string& tgt_path,
                              const std::string& out_src_path, const std::string& out_tgt_path) const;

    RunStats runTabSeparatedFile(const std::string& in_path, const std::string& out_path) const;

private:
    std::vector<corpus::PairOutcome> processBatch(const std::vector<corpus::SentencePair>& batch) const;
    void recordOutcome(const corpus::PairOutcome& outcome, std::size_t line_no, RunStats& stats) const;

    const corpus::Pipeline& pipeline_;
    RunnerSettings settings_;
};

} // namespace app

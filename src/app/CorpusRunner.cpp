#include "CorpusRunner.hpp"

#include "corpus/Diagnostics.hpp"
#include "utils/ErrorReporter.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <istream>
#include <limits>
#include <ostream>
#include <system_error>
#include <thread>

#include <plog/Log.h>

namespace app
{

namespace
{

std::size_t readPositive(const toml::table& section, std::string_view key, std::size_t fallback,
                         std::size_t max = std::numeric_limits<std::size_t>::max())
{
    auto node = section[key];
    if (!node)
        return fallback;
    auto value = node.value_exact<int64_t>();
    if (!value || *value < 1)
        throw std::invalid_argument(std::string(key) + " must be a positive integer");
    if (static_cast<uint64_t>(*value) > max)
        throw std::invalid_argument(std::string(key) + " must not exceed " + std::to_string(max));
    return static_cast<std::size_t>(*value);
}

// getline without the trailing CR of CRLF files
bool readLine(std::istream& in, std::string& line)
{
    if (!std::getline(in, line))
    {
        if (in.bad())
            throw IoError("read error");
        return false;
    }
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return true;
}

void checkWritable(const std::ostream& out, const std::string& what)
{
    if (!out)
        throw IoError("failed writing " + what);
}

} // namespace

RunnerSettings RunnerSettings::Parse(const toml::table& section)
{
    RunnerSettings settings;
    settings.threads = readPositive(section, "threads", settings.threads, kMaxThreads);
    settings.batch_size = readPositive(section, "batch_size", settings.batch_size);
    return settings;
}

CorpusRunner::CorpusRunner(const corpus::Pipeline& pipeline, RunnerSettings settings)
    : pipeline_(pipeline)
    , settings_(settings)
{
    settings_.threads = std::clamp<std::size_t>(settings_.threads, 1, RunnerSettings::kMaxThreads);
    settings_.batch_size = std::max<std::size_t>(settings_.batch_size, 1);
}

std::vector<corpus::PairOutcome> CorpusRunner::processBatch(const std::vector<corpus::SentencePair>& batch) const
{
    std::vector<corpus::PairOutcome> outcomes(batch.size());
    const std::size_t workers = std::min(settings_.threads, batch.size());

    if (workers <= 1)
    {
        for (std::size_t i = 0; i < batch.size(); ++i)
            outcomes[i] = pipeline_.process(batch[i]);
        return outcomes;
    }

    // contiguous shards, each worker writes only its own slots
    const std::size_t shard = (batch.size() + workers - 1) / workers;
    std::vector<std::exception_ptr> failures(workers);

    auto run_shard = [this, &batch, &outcomes, &failures, shard](std::size_t w)
    {
        const std::size_t begin = w * shard;
        const std::size_t end = std::min(batch.size(), begin + shard);
        try
        {
            for (std::size_t i = begin; i < end; ++i)
                outcomes[i] = pipeline_.process(batch[i]);
        }
        catch (const std::exception&)
        {
            failures[w] = std::current_exception();
        }
    };

    {
        // joined on scope exit
        std::vector<std::jthread> threads;
        threads.reserve(workers);

        std::size_t started = 0;
        try
        {
            for (; started < workers; ++started)
                threads.emplace_back(run_shard, started);
        }
        catch (const std::system_error& ex)
        {
            PLOG_WARNING << "Started " << started << " of " << workers
                         << " worker threads (" << ex.what() << "), running the rest on the caller";
        }

        for (std::size_t w = started; w < workers; ++w)
            run_shard(w);
    }

    for (const auto& failure : failures)
    {
        if (failure)
            std::rethrow_exception(failure);
    }
    return outcomes;
}

void CorpusRunner::recordOutcome(const corpus::PairOutcome& outcome, std::size_t line_no, RunStats& stats) const
{
    stats.record(outcome);
    if (outcome.error)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Pipeline, "Pair dropped after a stage failure",
                                            "line " + std::to_string(line_no) + ", stage '" + outcome.rejected_by +
                                                "': " + *outcome.error);
    }
}

RunStats CorpusRunner::runParallel(std::istream& src, std::istream& tgt, std::ostream& out_src,
                                   std::ostream& out_tgt) const
{
    RunStats stats;
    std::vector<corpus::SentencePair> batch;
    batch.reserve(settings_.batch_size);
    std::size_t lines_done = 0;

    auto flush = [&]()
    {
        const auto outcomes = processBatch(batch);
        for (std::size_t i = 0; i < outcomes.size(); ++i)
        {
            recordOutcome(outcomes[i], lines_done + i + 1, stats);
            if (outcomes[i].kept())
            {
                out_src << outcomes[i].pair->source << '\n';
                out_tgt << outcomes[i].pair->target << '\n';
            }
        }
        checkWritable(out_src, "source output");
        checkWritable(out_tgt, "target output");
        lines_done += batch.size();
        batch.clear();
    };

    std::string source;
    std::string target;
    while (true)
    {
        const bool has_source = readLine(src, source);
        const bool has_target = readLine(tgt, target);
        if (!has_source && !has_target)
            break;
        if (has_source != has_target)
        {
            const std::size_t line_no = lines_done + batch.size() + 1;
            throw IoError("source and target differ in line count: " +
                          std::string(has_source ? "target" : "source") + " ends before line " +
                          std::to_string(line_no));
        }

        batch.push_back(corpus::SentencePair{ std::move(source), std::move(target) });
        if (batch.size() >= settings_.batch_size)
            flush();
    }
    flush();

    out_src.flush();
    out_tgt.flush();
    checkWritable(out_src, "source output");
    checkWritable(out_tgt, "target output");
    return stats;
}

RunStats CorpusRunner::runTabSeparated(std::istream& in, std::ostream& out) const
{
    RunStats stats;
    std::vector<corpus::SentencePair> batch;
    std::vector<std::size_t> line_numbers;
    batch.reserve(settings_.batch_size);
    line_numbers.reserve(settings_.batch_size);

    auto flush = [&]()
    {
        const auto outcomes = processBatch(batch);
        for (std::size_t i = 0; i < outcomes.size(); ++i)
        {
            recordOutcome(outcomes[i], line_numbers[i], stats);
            if (outcomes[i].kept())
                out << corpus::TabPairCodec::encode(*outcomes[i].pair) << '\n';
        }
        checkWritable(out, "output");
        batch.clear();
        line_numbers.clear();
    };

    std::string line;
    std::size_t line_no = 0;
    while (readLine(in, line))
    {
        ++line_no;
        auto pair = corpus::TabPairCodec::decode(line);
        if (!pair)
        {
            ++stats.read;
            ++stats.malformed;
            PLOG_WARNING_(corpus::Diagnostics::kLogInstance)
                << "[Runner] line " << line_no << " does not have two tab-separated fields: "
                << corpus::Diagnostics::Preview(line);
            continue;
        }

        batch.push_back(std::move(*pair));
        line_numbers.push_back(line_no);
        if (batch.size() >= settings_.batch_size)
            flush();
    }
    flush();

    out.flush();
    checkWritable(out, "output");
    return stats;
}

RunStats CorpusRunner::runParallelFiles(const std::string& src_path, const std::string& tgt_path,
                                        const std::string& out_src_path, const std::string& out_tgt_path) const
{
    std::ifstream src(src_path, std::ios::binary);
    if (!src)
        throw IoError("cannot open " + src_path);
    std::ifstream tgt(tgt_path, std::ios::binary);
    if (!tgt)
        throw IoError("cannot open " + tgt_path);
    std::ofstream out_src(out_src_path, std::ios::binary | std::ios::trunc);
    if (!out_src)
        throw IoError("cannot create " + out_src_path);
    std::ofstream out_tgt(out_tgt_path, std::ios::binary | std::ios::trunc);
    if (!out_tgt)
        throw IoError("cannot create " + out_tgt_path);

    PLOG_INFO << "Cleaning " << src_path << " + " << tgt_path << " with " << settings_.threads << " thread(s)";
    return runParallel(src, tgt, out_src, out_tgt);
}

RunStats CorpusRunner::runTabSeparatedFile(const std::string& in_path, const std::string& out_path) const
{
    std::ifstream in(in_path, std::ios::binary);
    if (!in)
        throw IoError("cannot open " + in_path);
    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw IoError("cannot create " + out_path);

    PLOG_INFO << "Cleaning " << in_path << " with " << settings_.threads << " thread(s)";
    return runTabSeparated(in, out);
}

} // namespace app

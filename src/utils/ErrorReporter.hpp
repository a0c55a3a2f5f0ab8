#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, ICU data
    Configuration,  // TOML parsing, invalid stage parameters
    Io,             // corpus files
    Pipeline,       // a stage failed on a pair
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // the run continues, some pairs may be lost
    Error,   // a step failed, the run cannot start or finish
    Fatal    // the run stops
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short, actionable message
    std::string technical_details; // Path, line, stage

    // true for reports that end the run and are printed on stderr
    [[nodiscard]] bool stopsRun() const
    {
        return severity == ErrorSeverity::Error || severity == ErrorSeverity::Fatal;
    }
};

/**
 * @brief Thread-safe error reporter
 *
 * Logs every report through plog and keeps a bounded queue the driver
 * prints when the run ends.
 *
 * Usage:
 *   ErrorReporter::ReportFatal(ErrorCategory::Configuration,
 *                              "Invalid pipeline configuration",
 *                              "filter 'lenn': unknown type");
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                             const std::string& user_message,
                             const std::string& technical_details = "");

    /**
     * @brief Get all pending reports and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);

    // "[Category] message: details"
    static std::string Format(const ErrorReport& report);

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr std::size_t kMaxQueueSize = 100;
};

} // namespace utils

#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <chrono>
#include <ios>
#include <array>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, config file, tree feed setup
    Configuration,  // TOML parsing, invalid values
    Automation,     // faults reported by the automation engine
    EventFeed,      // malformed notification lines, unreadable input
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded functionality, but continues
    Error,   // Operation failed, but app can continue
    Fatal    // Critical error, app should exit
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short, non-technical description
    std::string technical_details; // Technical details for logs/bug reports
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe error reporter for the host application
 *
 * Collects errors from the application layer and the automation engine. Every
 * report is logged through plog and queued; the queue is drained into a
 * bounded history (and the optional error log file) when consumed.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::EventFeed,
 *                              "Skipped malformed notification",
 *                              "line 12: missing 'package'");
 *
 *   if (ErrorReporter::HasPendingErrors()) {
 *       auto errors = ErrorReporter::GetPendingErrors();
 *       ...
 *   }
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

    static void ReportInfo(ErrorCategory category,
                          const std::string& user_message,
                          const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Get all pending errors, move them to history and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    static ErrorReport GetLastError();

    static void ClearErrors();

    /// Reports per category since start (or the last ClearHistory), pending ones included
    static size_t CountFor(ErrorCategory category);

    /// "Automation: 2, Event Feed: 1"; empty when nothing was reported
    static std::string SummaryLine();

    static void FlushPendingToHistory();
    static std::vector<ErrorReport> GetHistorySnapshot();
    static void ClearHistory();

    /**
     * @brief Mirror history entries to a plain-text file
     */
    static void InitializeLogFile(const std::string& path, std::ios::openmode mode = std::ios::app);

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

private:
    static void LogReport(const ErrorReport& report);
    static void AppendToHistoryLocked(const ErrorReport& report);
    static void WriteToLogFile(const ErrorReport& report);

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static std::vector<ErrorReport> s_error_history;
    static std::string s_log_path;
    static bool s_log_initialized;
    static std::array<size_t, 5> s_category_counts;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
    static constexpr size_t MAX_HISTORY_SIZE = 500;
};

} // namespace utils

#include "ErrorReporter.hpp"
#include <plog/Log.h>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_error_queue;
std::vector<ErrorReport> ErrorReporter::s_error_history;
std::string ErrorReporter::s_log_path;
bool ErrorReporter::s_log_initialized = false;
std::array<size_t, 5> ErrorReporter::s_category_counts{};

ErrorReport::ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details)
    : category(cat)
    , severity(sev)
    , user_message(std::move(user_msg))
    , technical_details(std::move(tech_details))
    , timestamp(ErrorReporter::GetTimestamp())
    , is_fatal(sev == ErrorSeverity::Fatal)
{
}

void ErrorReporter::LogReport(const ErrorReport& report)
{
    std::ostringstream msg;
    msg << "[" << CategoryToString(report.category) << "] " << report.user_message;
    if (!report.technical_details.empty())
        msg << " | Details: " << report.technical_details;

    switch (report.severity)
    {
    case ErrorSeverity::Info:
        PLOG_INFO << msg.str();
        break;
    case ErrorSeverity::Warning:
        PLOG_WARNING << msg.str();
        break;
    case ErrorSeverity::Error:
        PLOG_ERROR << msg.str();
        break;
    case ErrorSeverity::Fatal:
        PLOG_FATAL << msg.str();
        break;
    }
}

void ErrorReporter::ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                                const std::string& technical_details)
{
    ErrorReport report(category, severity, user_message, technical_details);
    LogReport(report);

    std::lock_guard<std::mutex> lock(s_mutex);
    ++s_category_counts[static_cast<size_t>(category)];

    // Oldest pending report goes to history instead of being dropped
    if (s_error_queue.size() >= MAX_QUEUE_SIZE)
    {
        AppendToHistoryLocked(s_error_queue.front());
        s_error_queue.erase(s_error_queue.begin());
    }
    s_error_queue.push_back(std::move(report));
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Fatal, user_message, technical_details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Error, user_message, technical_details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Warning, user_message, technical_details);
}

void ErrorReporter::ReportInfo(ErrorCategory category, const std::string& user_message,
                               const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Info, user_message, technical_details);
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_error_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> errors;
    errors.swap(s_error_queue);
    for (const auto& report : errors)
        AppendToHistoryLocked(report);
    return errors;
}

ErrorReport ErrorReporter::GetLastError()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_error_queue.empty())
        return s_error_queue.back();
    if (!s_error_history.empty())
        return s_error_history.back();
    return ErrorReport();
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.clear();
}

size_t ErrorReporter::CountFor(ErrorCategory category)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_category_counts[static_cast<size_t>(category)];
}

std::string ErrorReporter::SummaryLine()
{
    std::array<size_t, 5> counts{};
    {
        std::lock_guard<std::mutex> lock(s_mutex);
        counts = s_category_counts;
    }

    std::string line;
    for (size_t i = 0; i < counts.size(); ++i)
    {
        if (counts[i] == 0)
            continue;
        if (!line.empty())
            line += ", ";
        line += CategoryToString(static_cast<ErrorCategory>(i)) + ": " + std::to_string(counts[i]);
    }
    return line;
}

void ErrorReporter::FlushPendingToHistory()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    for (const auto& report : s_error_queue)
        AppendToHistoryLocked(report);
    s_error_queue.clear();
}

std::vector<ErrorReport> ErrorReporter::GetHistorySnapshot()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_error_history;
}

void ErrorReporter::ClearHistory()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.clear();
    s_error_history.clear();
    s_category_counts.fill(0);
}

void ErrorReporter::InitializeLogFile(const std::string& path, std::ios::openmode mode)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_log_path = path;
    std::ofstream ofs(s_log_path, mode);
    s_log_initialized = static_cast<bool>(ofs);
    if (s_log_initialized)
        ofs << "\n=== Run started " << GetTimestamp() << " ===\n";
}

std::string ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Automation:
        return "Automation";
    case ErrorCategory::EventFeed:
        return "Event Feed";
    case ErrorCategory::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

std::string ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "Info";
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    case ErrorSeverity::Fatal:
        return "Fatal";
    }
    return "Unknown";
}

std::string ErrorReporter::GetTimestamp()
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

void ErrorReporter::AppendToHistoryLocked(const ErrorReport& report)
{
    if (s_error_history.size() >= MAX_HISTORY_SIZE)
        s_error_history.erase(s_error_history.begin());
    s_error_history.push_back(report);
    WriteToLogFile(report);
}

void ErrorReporter::WriteToLogFile(const ErrorReport& report)
{
    if (!s_log_initialized)
        return;

    std::ofstream ofs(s_log_path, std::ios::app);
    if (!ofs)
        return;

    ofs << "[" << report.timestamp << "] [" << CategoryToString(report.category) << "] ["
        << SeverityToString(report.severity) << "] " << report.user_message;
    if (!report.technical_details.empty())
        ofs << " | " << report.technical_details;
    ofs << '\n';
}

} // namespace utils

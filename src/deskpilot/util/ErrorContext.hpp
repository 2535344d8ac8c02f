#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <utility>

namespace deskpilot
{

/**
 * @brief Fault reporting channel from the automation core to its host
 *
 * The core does not depend on a logging or telemetry library. Faults caught at
 * the boundary of a processing cycle are handed to the host through this
 * callback; the host decides whether they reach logs, a crash sink or nothing.
 */

enum class ErrorSeverityLevel
{
    Info,
    Warning,
    Error
};

struct ErrorInfo
{
    ErrorSeverityLevel level = ErrorSeverityLevel::Error;
    std::string component;
    std::string message;
    std::string details;

    ErrorInfo() = default;
    ErrorInfo(ErrorSeverityLevel lvl, std::string comp, std::string msg, std::string det = "")
        : level(lvl)
        , component(std::move(comp))
        , message(std::move(msg))
        , details(std::move(det))
    {
    }
};

using ErrorCallback = std::function<void(const ErrorInfo&)>;

class ErrorContext
{
public:
    ErrorContext() = default;
    ~ErrorContext() = default;

    ErrorContext(const ErrorContext&) = delete;
    ErrorContext& operator=(const ErrorContext&) = delete;

    void SetCallback(ErrorCallback callback)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
    }

    void ReportError(const std::string& component, const std::string& message, const std::string& details = "")
    {
        Report(ErrorSeverityLevel::Error, component, message, details);
    }

    void ReportWarning(const std::string& component, const std::string& message, const std::string& details = "")
    {
        Report(ErrorSeverityLevel::Warning, component, message, details);
    }

    void ReportInfo(const std::string& component, const std::string& message, const std::string& details = "")
    {
        Report(ErrorSeverityLevel::Info, component, message, details);
    }

    bool HasCallback() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<bool>(callback_);
    }

    // Last error-level message, kept for Engine::last_error()
    std::string LastError() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_error_;
    }

    void ClearLastError()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_.clear();
    }

private:
    void Report(ErrorSeverityLevel level, const std::string& component, const std::string& message,
                const std::string& details)
    {
        ErrorCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level == ErrorSeverityLevel::Error)
                last_error_ = component + ": " + message;
            callback = callback_;
        }

        if (callback)
            callback(ErrorInfo(level, component, message, details));
    }

    mutable std::mutex mutex_;
    ErrorCallback callback_;
    std::string last_error_;
};

} // namespace deskpilot

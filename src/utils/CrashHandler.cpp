#include "CrashHandler.hpp"

#include <plog/Log.h>
#include <cpptrace/cpptrace.hpp>

#include <atomic>
#include <cstdlib>
#include <exception>
#include <sstream>
#include <string>

namespace
{

std::atomic<void (*)()> g_fatal_cleanup{ nullptr };
std::atomic<bool> g_in_handler{ false };
std::terminate_handler g_prev_terminate = nullptr;

thread_local const char* g_current_operation = nullptr;

void LogInFlightException()
{
    const std::exception_ptr current = std::current_exception();
    if (!current)
    {
        PLOG_FATAL << "std::terminate called without an active exception";
        return;
    }

    try
    {
        std::rethrow_exception(current);
    }
    catch (const std::exception& e)
    {
        PLOG_FATAL << "Unhandled exception: " << e.what();
    }
    catch (...)
    {
        PLOG_FATAL << "Unhandled exception of non-standard type";
    }
}

void LogStackTrace()
{
    const cpptrace::stacktrace trace = cpptrace::generate_trace(2);
    if (trace.empty())
    {
        PLOG_FATAL << "No stack trace available (cpptrace returned empty).";
        return;
    }

    std::istringstream lines(trace.to_string());
    std::string line;
    while (std::getline(lines, line))
    {
        if (!line.empty())
            PLOG_FATAL << line;
    }
}

void CrashTerminateHandler()
{
    // A second terminate from inside the handler goes straight to abort
    if (g_in_handler.exchange(true))
        std::abort();

    PLOG_FATAL << "Fatal error" << (g_current_operation ? std::string(" during ") + g_current_operation : "");
    LogInFlightException();
    LogStackTrace();

    if (auto fn = g_fatal_cleanup.load(std::memory_order_acquire))
        fn();

    PLOG_FATAL << "See run.log and flow.log in the log directory for the events leading up to this";

    if (g_prev_terminate)
        g_prev_terminate();
    std::abort();
}

} // namespace

void utils::CrashHandler::Initialize()
{
    g_prev_terminate = std::set_terminate(CrashTerminateHandler);
    PLOG_INFO << "Crash handler installed";
}

void utils::CrashHandler::SetContext(const char* operation) { g_current_operation = operation; }

void utils::CrashHandler::RegisterFatalCleanup(void (*fn)()) { g_fatal_cleanup.store(fn, std::memory_order_release); }

#pragma once

namespace utils
{

/**
 * Last-chance reporting for std::terminate().
 *
 * Logs the in-flight exception, the current operation and a stack trace
 * (cpptrace) to the main log, runs the registered cleanup, then aborts.
 */
class CrashHandler
{
public:
    /// Installs the terminate handler
    static void Initialize();

    /// Operation named in the report for crashes on the calling thread; nullptr clears it
    static void SetContext(const char* operation);

    /// Runs once from the handler before abort
    static void RegisterFatalCleanup(void (*fn)());
};

} // namespace utils

#pragma once

#include <chrono>
#include <sstream>
#include <string_view>

// DESKPILOT_PROFILING_LEVEL is set via CMake:
//   0 = Disabled (no profiling)
//   1 = Timer only (std::chrono + deskpilot::Logger)
//   2 = Tracy + Timer (full profiling)

#ifndef DESKPILOT_PROFILING_LEVEL
#define DESKPILOT_PROFILING_LEVEL 0
#endif

#if DESKPILOT_PROFILING_LEVEL >= 2
#include <tracy/Tracy.hpp>
#endif

#if DESKPILOT_PROFILING_LEVEL >= 1
#include "../api/logger.hpp"
#endif

namespace deskpilot::profiling
{

#if DESKPILOT_PROFILING_LEVEL >= 1
/// Profiling output sink, set by Engine::initialize
inline Logger* g_profiling_logger = nullptr;

inline void SetProfilingLogger(Logger* logger) noexcept { g_profiling_logger = logger; }

/**
 * @brief RAII scope timer
 *
 * Logs the elapsed time of the enclosing scope through the engine's debug sink.
 * Processing cycles are dominated by round trips to the UI platform, so this is
 * mostly useful to see which locator strategy or detector signal is slow.
 */
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string_view name) noexcept
        : name_(name)
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer() noexcept
    {
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_);

        if (g_profiling_logger && g_profiling_logger->debug)
        {
            std::ostringstream oss;
            oss << "[PROFILE] " << name_ << " took " << elapsed.count() << " us";
            g_profiling_logger->debug(oss.str());
        }
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;
    ScopeTimer(ScopeTimer&&) = delete;
    ScopeTimer& operator=(ScopeTimer&&) = delete;

private:
    std::string_view name_;
    std::chrono::steady_clock::time_point start_;
};
#endif

} // namespace deskpilot::profiling

#if DESKPILOT_PROFILING_LEVEL == 0
#define PROFILE_SCOPE_FUNCTION() ((void)0)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ((void)sizeof(nameExpr))
#define PROFILE_THREAD_NAME(nameExpr) ((void)0)

#elif DESKPILOT_PROFILING_LEVEL == 1
#define PROFILE_SCOPE_FUNCTION() ::deskpilot::profiling::ScopeTimer __profiling_timer(__FUNCTION__)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ::deskpilot::profiling::ScopeTimer __profiling_timer(nameExpr)
#define PROFILE_THREAD_NAME(nameExpr) ((void)0)

#elif DESKPILOT_PROFILING_LEVEL >= 2
#define PROFILE_SCOPE_FUNCTION() \
    ZoneScopedN(__FUNCTION__);   \
    ::deskpilot::profiling::ScopeTimer __profiling_timer(__FUNCTION__)

#define PROFILE_SCOPE_CUSTOM(nameExpr) \
    ZoneScoped;                        \
    ::deskpilot::profiling::ScopeTimer __profiling_timer(nameExpr)

#define PROFILE_THREAD_NAME(nameExpr) tracy::SetThreadName(nameExpr)

#endif

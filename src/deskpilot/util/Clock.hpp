#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>

namespace deskpilot
{

using TimePoint = std::chrono::steady_clock::time_point;

/**
 * @brief Time source used for rate limiting, stuck-state timeouts and settle delays
 *
 * Every wall-clock comparison in the engine goes through this interface so the
 * flow can be driven deterministically from tests.
 */
class IClock
{
public:
    virtual ~IClock() = default;

    virtual TimePoint Now() const = 0;

    /**
     * @brief Block the calling thread for the given duration
     */
    virtual void SleepFor(std::chrono::milliseconds duration) = 0;
};

class SteadyClock final : public IClock
{
public:
    TimePoint Now() const override { return std::chrono::steady_clock::now(); }

    void SleepFor(std::chrono::milliseconds duration) override
    {
        if (duration.count() > 0)
            std::this_thread::sleep_for(duration);
    }
};

// Manually advanced clock. SleepFor advances time instead of blocking.
class ManualClock final : public IClock
{
public:
    ManualClock() = default;

    TimePoint Now() const override
    {
        return TimePoint(std::chrono::steady_clock::duration(ticks_.load(std::memory_order_acquire)));
    }

    void SleepFor(std::chrono::milliseconds duration) override { Advance(duration); }

    void Advance(std::chrono::milliseconds duration)
    {
        ticks_.fetch_add(std::chrono::duration_cast<std::chrono::steady_clock::duration>(duration).count(),
                         std::memory_order_acq_rel);
    }

private:
    // Starts well past the epoch so "now - timeout" never underflows
    std::atomic<std::int64_t> ticks_{
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::hours(1)).count()
    };
};

} // namespace deskpilot

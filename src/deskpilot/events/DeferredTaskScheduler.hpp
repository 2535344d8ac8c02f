#pragma once

#include "../util/Clock.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace deskpilot
{

enum class TaskPurpose
{
    SettleDelay, // debounced processing after a window change
    Retry        // follow-up cycle requested by the flow
};

const char* TaskPurposeName(TaskPurpose purpose);

/**
 * @brief Cancellable deferred tasks, at most one pending per purpose
 *
 * Scheduling a purpose replaces whatever was pending under it. Due tasks run
 * one after another on the scheduler thread (when started) or on the caller of
 * RunDue(). Time is read from the supplied IClock, so with a ManualClock the
 * tests decide when tasks become due.
 */
class DeferredTaskScheduler
{
public:
    using Task = std::function<void()>;
    using FaultHandler = std::function<void(const std::string&)>;

    explicit DeferredTaskScheduler(IClock& clock, FaultHandler on_fault = {});
    ~DeferredTaskScheduler();

    DeferredTaskScheduler(const DeferredTaskScheduler&) = delete;
    DeferredTaskScheduler& operator=(const DeferredTaskScheduler&) = delete;

    /// Start the scheduler thread. Without it, tasks only run via RunDue().
    void Start();
    void Stop();

    void Schedule(TaskPurpose purpose, std::chrono::milliseconds delay, Task task);
    void Cancel(TaskPurpose purpose);
    void CancelAll();

    bool IsPending(TaskPurpose purpose) const;
    std::size_t PendingCount() const;

    /// Run every task that is due now. @return number of tasks run
    std::size_t RunDue();

private:
    struct Entry
    {
        TimePoint due;
        Task task;
        std::uint64_t id = 0;
    };

    void WorkerLoop(std::stop_token stop);
    bool TakeDue(Task& out);

    IClock& clock_;
    FaultHandler on_fault_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::map<TaskPurpose, Entry> pending_;
    std::uint64_t next_id_ = 1;
    std::jthread worker_;
};

} // namespace deskpilot

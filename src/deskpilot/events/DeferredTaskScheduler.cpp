#include "DeferredTaskScheduler.hpp"
#include "../util/Profile.hpp"

#include <utility>

namespace deskpilot
{

const char* TaskPurposeName(TaskPurpose purpose)
{
    switch (purpose)
    {
    case TaskPurpose::SettleDelay:
        return "settle-delay";
    case TaskPurpose::Retry:
        return "retry";
    }
    return "unknown";
}

DeferredTaskScheduler::DeferredTaskScheduler(IClock& clock, FaultHandler on_fault)
    : clock_(clock)
    , on_fault_(std::move(on_fault))
{
}

DeferredTaskScheduler::~DeferredTaskScheduler()
{
    Stop();
    CancelAll();
}

void DeferredTaskScheduler::Start()
{
    if (worker_.joinable())
        return;

    worker_ = std::jthread([this](std::stop_token stoken) { WorkerLoop(stoken); });
}

void DeferredTaskScheduler::Stop()
{
    if (!worker_.joinable())
        return;

    worker_.request_stop();
    cv_.notify_all();
    worker_.join();
}

void DeferredTaskScheduler::Schedule(TaskPurpose purpose, std::chrono::milliseconds delay, Task task)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_[purpose] = Entry{ clock_.Now() + delay, std::move(task), next_id_++ };
    }
    cv_.notify_all();
}

void DeferredTaskScheduler::Cancel(TaskPurpose purpose)
{
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(purpose);
}

void DeferredTaskScheduler::CancelAll()
{
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.clear();
}

bool DeferredTaskScheduler::IsPending(TaskPurpose purpose) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.find(purpose) != pending_.end();
}

std::size_t DeferredTaskScheduler::PendingCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool DeferredTaskScheduler::TakeDue(Task& out)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint now = clock_.Now();

    auto earliest = pending_.end();
    for (auto it = pending_.begin(); it != pending_.end(); ++it)
    {
        if (it->second.due > now)
            continue;
        if (earliest == pending_.end() || it->second.id < earliest->second.id)
            earliest = it;
    }

    if (earliest == pending_.end())
        return false;

    out = std::move(earliest->second.task);
    pending_.erase(earliest);
    return true;
}

std::size_t DeferredTaskScheduler::RunDue()
{
    std::size_t ran = 0;
    Task task;
    while (TakeDue(task))
    {
        ++ran;
        try
        {
            task();
        }
        catch (const std::exception& e)
        {
            if (on_fault_)
                on_fault_(std::string("Deferred task failed: ") + e.what());
        }
        task = nullptr;
    }
    return ran;
}

void DeferredTaskScheduler::WorkerLoop(std::stop_token stop)
{
    PROFILE_THREAD_NAME("deskpilot-scheduler");
    using namespace std::chrono_literals;

    while (!stop.stop_requested())
    {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            // Bounded wait: due times come from IClock, which may not be the system clock
            cv_.wait_for(lock, stop, 50ms, [] { return false; });
        }
        if (stop.stop_requested())
            break;
        RunDue();
    }
}

} // namespace deskpilot

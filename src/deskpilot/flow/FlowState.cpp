#include "FlowState.hpp"

namespace deskpilot
{

const char* FlowStepName(FlowStep step)
{
    switch (step)
    {
    case FlowStep::Idle:
        return "Idle";
    case FlowStep::AwaitingShareDialog:
        return "AwaitingShareDialog";
    case FlowStep::AwaitingChooser:
        return "AwaitingChooser";
    case FlowStep::AwaitingShareConfirm:
        return "AwaitingShareConfirm";
    }
    return "Unknown";
}

FlowState::FlowState(TimePoint now)
    : last_activity_(now.time_since_epoch().count())
{
}

void FlowState::TransitionTo(FlowStep step, TimePoint now)
{
    step_.store(step, std::memory_order_release);
    Touch(now);
}

void FlowState::Reset(TimePoint now) { TransitionTo(FlowStep::Idle, now); }

TimePoint FlowState::LastActivity() const
{
    return TimePoint(TimePoint::duration(last_activity_.load(std::memory_order_acquire)));
}

void FlowState::Touch(TimePoint now) { last_activity_.store(now.time_since_epoch().count(), std::memory_order_release); }

FlowStats FlowState::Stats() const
{
    FlowStats stats;
    stats.dialogs_detected = dialogs_detected_.load(std::memory_order_relaxed);
    stats.auto_accept_count = auto_accept_count_.load(std::memory_order_relaxed);
    stats.shares_completed = shares_completed_.load(std::memory_order_relaxed);
    stats.step = Step();
    return stats;
}

bool FlowState::TryBeginCycle()
{
    bool expected = false;
    return processing_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

void FlowState::EndCycle() { processing_.store(false, std::memory_order_release); }

} // namespace deskpilot

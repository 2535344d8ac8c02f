#pragma once

#include "../util/Clock.hpp"

#include <atomic>
#include <cstdint>

namespace deskpilot
{

enum class FlowStep : int
{
    Idle = 0,
    AwaitingShareDialog = 1,
    AwaitingChooser = 2,
    AwaitingShareConfirm = 3
};

const char* FlowStepName(FlowStep step);

struct FlowStats
{
    std::uint64_t dialogs_detected = 0;
    std::uint64_t auto_accept_count = 0;
    std::uint64_t shares_completed = 0;
    FlowStep step = FlowStep::Idle;
};

/**
 * @brief Session record of one automation run
 *
 * Step, counters and timestamps are written only by the active cycle and by
 * lifecycle resets. Everything is atomic so status queries may read from any
 * thread; readers see an eventually consistent view.
 */
class FlowState
{
public:
    explicit FlowState(TimePoint now);

    FlowState(const FlowState&) = delete;
    FlowState& operator=(const FlowState&) = delete;

    FlowStep Step() const { return step_.load(std::memory_order_acquire); }

    /// Move to `step` and refresh the activity timestamp.
    void TransitionTo(FlowStep step, TimePoint now);

    /// Back to Idle with a fresh activity timestamp; counters are kept.
    void Reset(TimePoint now);

    TimePoint LastActivity() const;
    void Touch(TimePoint now);

    void CountDialogDetected() { dialogs_detected_.fetch_add(1, std::memory_order_relaxed); }
    void CountAutoAccept() { auto_accept_count_.fetch_add(1, std::memory_order_relaxed); }
    void CountShareCompleted() { shares_completed_.fetch_add(1, std::memory_order_relaxed); }

    FlowStats Stats() const;

    /// Single-flight guard: true if the caller now owns the processing slot.
    bool TryBeginCycle();
    void EndCycle();
    bool IsProcessing() const { return processing_.load(std::memory_order_acquire); }

private:
    std::atomic<FlowStep> step_{ FlowStep::Idle };
    std::atomic<TimePoint::rep> last_activity_;
    std::atomic<std::uint64_t> dialogs_detected_{ 0 };
    std::atomic<std::uint64_t> auto_accept_count_{ 0 };
    std::atomic<std::uint64_t> shares_completed_{ 0 };
    std::atomic<bool> processing_{ false };
};

/// Owns the processing slot for the lifetime of a cycle.
class ProcessingLease
{
public:
    explicit ProcessingLease(FlowState& state) noexcept
        : state_(&state)
    {
    }
    ~ProcessingLease()
    {
        if (state_)
            state_->EndCycle();
    }

    ProcessingLease(const ProcessingLease&) = delete;
    ProcessingLease& operator=(const ProcessingLease&) = delete;

private:
    FlowState* state_;
};

} // namespace deskpilot

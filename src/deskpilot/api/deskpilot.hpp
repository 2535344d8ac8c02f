#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "logger.hpp"
#include "../events/ChangeEvent.hpp"
#include "../events/EventGate.hpp"
#include "../flow/FlowController.hpp"
#include "../flow/FlowState.hpp"
#include "../tree/IUiTree.hpp"
#include "../util/Clock.hpp"
#include "../util/ErrorContext.hpp"

namespace deskpilot
{

enum class Status
{
    Stopped,   // not connected; notifications are dropped
    Running,   // connected and processing notifications
    Error      // initialize() rejected the configuration
};

struct Config
{
    std::string source_package = "com.anydesk.anydeskandroid";
    std::string companion_package = "com.android.systemui";

    int min_process_interval_ms = 800;  // rate limit between accepted triggers
    int settle_delay_ms = 400;          // debounce before a cycle runs
    int stuck_timeout_ms = 30000;       // no progress for this long resets the flow
    int retry_delay_ms = 500;           // follow-up after a fallback transition
    int chooser_retry_delay_ms = 800;   // follow-up after picking "entire screen"
    int confirm_retry_delay_ms = 1000;  // retry after a failed confirm click
    int action_settle_ms = 100;         // pause between focus and click
    int source_render_wait_ms = 300;
    int companion_render_wait_ms = 500;

    bool verbose = false;
    // Also treat window-content changes as triggers (not only window-state changes)
    bool trigger_on_content_changes = false;
    // When false, deferred tasks only run through Engine::run_due_tasks()
    bool run_scheduler_thread = true;
};

struct Stats
{
    std::uint64_t dialogs_detected = 0;
    std::uint64_t auto_accept_count = 0;
    std::uint64_t shares_completed = 0;
    std::uint64_t cycles_run = 0;
    std::uint64_t cycles_dropped = 0; // fired while another cycle was in flight
    FlowStep step = FlowStep::Idle;
    bool service_enabled = false;
};

/**
 * @brief Automation engine for the incoming-connection and screen-share flow
 *
 * Lifecycle mirrors a platform accessibility service: initialize() once, then
 * on_connected() to start a session and on_interrupt() / on_unbind() /
 * on_destroy() to end it. Between those, every notification goes through
 * on_change(), which never blocks. Processing cycles run on one background
 * worker, one at a time.
 */
class Engine
{
public:
    explicit Engine(IUiTree& tree, IClock* clock = nullptr);
    ~Engine() noexcept;

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    bool initialize(const Config& cfg, Logger loggers = {}, NotificationSink notify = {});

    /// @return what is wrong with @p cfg, or an empty string when initialize() would accept it
    static std::string validate(const Config& cfg);
    void set_error_callback(ErrorCallback callback);

    void on_connected();
    void on_interrupt();
    void on_unbind();
    void on_destroy();

    GateDecision on_change(const ChangeEvent& event);

    bool service_enabled() const;
    Status status() const { return status_.load(std::memory_order_acquire); }
    Stats stats() const;
    void log_stats() const;
    std::string last_error() const;

    /// Run deferred tasks that are due now on the calling thread. @return tasks run
    std::size_t run_due_tasks();

    /// Block until the background worker has no cycle queued or running.
    void wait_idle();

    std::optional<CycleResult> last_cycle() const;

private:
    void end_session(const char* reason);

    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::atomic<Status> status_{ Status::Stopped };
};

} // namespace deskpilot

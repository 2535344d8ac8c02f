#include "deskpilot.hpp"

#include "../action/ActionExecutor.hpp"
#include "../detection/DialogDetector.hpp"
#include "../events/DeferredTaskScheduler.hpp"
#include "../locating/NodeLocator.hpp"
#include "../signatures/UiSignatures.hpp"
#include "../tree/NodeAccess.hpp"
#include "../util/Profile.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <sstream>
#include <utility>

#include <BS_thread_pool.hpp>

namespace deskpilot
{

struct Engine::Impl
{
    Impl(IUiTree& t, IClock* c)
        : tree(t)
        , owned_clock(c ? nullptr : std::make_unique<SteadyClock>())
        , clock(c ? c : owned_clock.get())
        , access(t)
    {
    }

    Config cfg{};
    Logger log{};
    NotificationSink notify;
    ErrorContext errors;

    IUiTree& tree;
    std::unique_ptr<IClock> owned_clock;
    IClock* clock;

    NodeAccess access;
    UiSignatures signatures;
    std::unique_ptr<NodeLocator> locator;
    std::unique_ptr<DialogDetector> detector;
    std::unique_ptr<ActionExecutor> executor;

    // Session objects, recreated on every connect. Swapped under both
    // lifecycle_mutex and session_mutex; status readers only take the latter.
    std::unique_ptr<FlowState> state;
    std::unique_ptr<FlowController> controller;

    std::unique_ptr<DeferredTaskScheduler> scheduler;
    std::unique_ptr<EventGate> gate;

    // Single background worker for processing cycles
    std::unique_ptr<BS::light_thread_pool> worker;

    std::atomic<bool> enabled{ false };
    std::atomic<std::uint64_t> cycles_run{ 0 };
    std::atomic<std::uint64_t> cycles_dropped{ 0 };

    mutable std::mutex result_mutex;
    std::optional<CycleResult> last_result;

    std::mutex lifecycle_mutex;
    mutable std::mutex session_mutex;

    void LaunchCycle(MonitoredApp app, std::optional<FlowStep> only_if_step);
    void Quiesce();
};

void Engine::Impl::LaunchCycle(MonitoredApp app, std::optional<FlowStep> only_if_step)
{
    // Session objects are only swapped under this lock
    std::lock_guard<std::mutex> lock(lifecycle_mutex);
    if (!enabled.load(std::memory_order_acquire) || !state || !controller)
        return;

    if (!state->TryBeginCycle())
    {
        cycles_dropped.fetch_add(1, std::memory_order_relaxed);
        if (log.debug)
            log.debug(std::string("Cycle for ") + MonitoredAppName(app) + " dropped: another cycle is in flight");
        return;
    }

    try
    {
        worker->detach_task(
            [this, app, only_if_step]()
            {
                PROFILE_THREAD_NAME("deskpilot-worker");
                ProcessingLease lease(*state);

                if (only_if_step && state->Step() != *only_if_step)
                {
                    if (log.debug)
                        log.debug(std::string("Retry skipped, flow is now in ") + FlowStepName(state->Step()));
                    return;
                }

                CycleResult result = controller->RunCycle(app);
                cycles_run.fetch_add(1, std::memory_order_relaxed);

                std::lock_guard<std::mutex> lock(result_mutex);
                last_result = result;
            });
    }
    catch (const std::exception& e)
    {
        state->EndCycle();
        errors.ReportError("Engine", "Failed to dispatch processing cycle", e.what());
        if (log.error)
            log.error(std::string("Failed to dispatch processing cycle: ") + e.what());
    }
}

void Engine::Impl::Quiesce()
{
    if (scheduler)
        scheduler->CancelAll();
    if (worker)
        worker->wait();
}

Engine::Engine(IUiTree& tree, IClock* clock)
    : impl_(std::make_unique<Impl>(tree, clock))
{
}

Engine::~Engine() noexcept
{
    if (impl_->scheduler)
        impl_->scheduler->Stop();
    impl_->enabled.store(false, std::memory_order_release);
    impl_->Quiesce();

#if DESKPILOT_PROFILING_LEVEL >= 1
    if (profiling::g_profiling_logger == &impl_->log)
        profiling::SetProfilingLogger(nullptr);
#endif
}

std::string Engine::validate(const Config& cfg)
{
    if (cfg.source_package.empty() || cfg.companion_package.empty())
        return "source and companion packages must be set";
    if (cfg.source_package == cfg.companion_package)
        return "source and companion packages must differ";
    if (cfg.min_process_interval_ms < 0 || cfg.settle_delay_ms < 0 || cfg.stuck_timeout_ms <= 0 ||
        cfg.retry_delay_ms < 0 || cfg.chooser_retry_delay_ms < 0 || cfg.confirm_retry_delay_ms < 0 ||
        cfg.action_settle_ms < 0 || cfg.source_render_wait_ms < 0 || cfg.companion_render_wait_ms < 0)
        return "timing values must not be negative and the stuck timeout must be positive";
    return {};
}

bool Engine::initialize(const Config& cfg, Logger loggers, NotificationSink notify)
{
    // Re-initialization: the scheduler thread takes the lifecycle lock, so join it first
    if (impl_->scheduler)
        impl_->scheduler->Stop();

    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);

    if (impl_->scheduler)
    {
        impl_->enabled.store(false, std::memory_order_release);
        impl_->Quiesce();

        std::lock_guard<std::mutex> session(impl_->session_mutex);
        impl_->controller.reset();
        impl_->state.reset();
        impl_->gate.reset();
    }

    impl_->log = std::move(loggers);
    impl_->notify = std::move(notify);

#if DESKPILOT_PROFILING_LEVEL >= 1
    profiling::SetProfilingLogger(&impl_->log);
#endif

    const std::string problem = validate(cfg);

    if (!problem.empty())
    {
        impl_->errors.ReportError("Engine", "Invalid configuration", problem);
        if (impl_->log.error)
            impl_->log.error("Invalid configuration: " + problem);
        status_ = Status::Error;
        return false;
    }

    {
        std::lock_guard<std::mutex> session(impl_->session_mutex);
        impl_->cfg = cfg;
    }
    impl_->signatures = UiSignatures::ForPackages(cfg.source_package, cfg.companion_package);
    impl_->locator = std::make_unique<NodeLocator>(impl_->access, impl_->signatures.recipes, impl_->log);
    impl_->detector =
        std::make_unique<DialogDetector>(impl_->access, *impl_->locator, impl_->signatures.profiles, impl_->log);
    impl_->executor = std::make_unique<ActionExecutor>(*impl_->clock, impl_->log,
                                                       std::chrono::milliseconds(cfg.action_settle_ms));

    impl_->worker = std::make_unique<BS::light_thread_pool>(1);
    impl_->scheduler = std::make_unique<DeferredTaskScheduler>(
        *impl_->clock,
        [this](const std::string& msg)
        {
            impl_->errors.ReportWarning("Scheduler", msg);
            if (impl_->log.warn)
                impl_->log.warn(msg);
        });

    GateSettings gate;
    gate.source_package = cfg.source_package;
    gate.companion_package = cfg.companion_package;
    gate.trigger_kinds = { EventKind::WindowStateChanged };
    if (cfg.trigger_on_content_changes)
        gate.trigger_kinds.push_back(EventKind::WindowContentChanged);
    gate.min_process_interval = std::chrono::milliseconds(cfg.min_process_interval_ms);
    gate.settle_delay = std::chrono::milliseconds(cfg.settle_delay_ms);

    auto new_gate = std::make_unique<EventGate>(std::move(gate), *impl_->scheduler, *impl_->clock,
                                                [this](MonitoredApp app) { impl_->LaunchCycle(app, std::nullopt); });
    {
        std::lock_guard<std::mutex> session(impl_->session_mutex);
        impl_->gate = std::move(new_gate);
    }

    if (cfg.run_scheduler_thread)
        impl_->scheduler->Start();

    if (impl_->log.info)
        impl_->log.info("Engine initialized: source=" + cfg.source_package + " companion=" + cfg.companion_package);

    status_ = Status::Stopped;
    return true;
}

void Engine::set_error_callback(ErrorCallback callback) { impl_->errors.SetCallback(std::move(callback)); }

void Engine::on_connected()
{
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);

    if (!impl_->gate)
    {
        impl_->errors.ReportError("Engine", "on_connected before a successful initialize()");
        if (impl_->log.error)
            impl_->log.error("on_connected called before a successful initialize()");
        return;
    }

    // A previous session may still have a cycle on the worker
    impl_->enabled.store(false, std::memory_order_release);
    impl_->Quiesce();

    auto state = std::make_unique<FlowState>(impl_->clock->Now());

    FlowTiming timing;
    timing.stuck_timeout = std::chrono::milliseconds(impl_->cfg.stuck_timeout_ms);
    timing.source_render_wait = std::chrono::milliseconds(impl_->cfg.source_render_wait_ms);
    timing.companion_render_wait = std::chrono::milliseconds(impl_->cfg.companion_render_wait_ms);
    timing.retry_delay = std::chrono::milliseconds(impl_->cfg.retry_delay_ms);
    timing.chooser_retry_delay = std::chrono::milliseconds(impl_->cfg.chooser_retry_delay_ms);
    timing.confirm_retry_delay = std::chrono::milliseconds(impl_->cfg.confirm_retry_delay_ms);

    auto controller = std::make_unique<FlowController>(
        FlowController::Dependencies{ *state, impl_->access, *impl_->locator, *impl_->detector,
                                      *impl_->executor, *impl_->clock, impl_->log, impl_->errors },
        timing, impl_->signatures.entire_screen_fragment);

    controller->SetNotificationSink(impl_->notify);
    controller->SetRetryRequest(
        [this](MonitoredApp app, std::chrono::milliseconds delay, std::optional<FlowStep> only_if_step)
        {
            if (impl_->log.debug)
                impl_->log.debug("Retry scheduled in " + std::to_string(delay.count()) + " ms");
            impl_->scheduler->Schedule(TaskPurpose::Retry, delay,
                                       [this, app, only_if_step]() { impl_->LaunchCycle(app, only_if_step); });
        });

    // The previous session's objects are destroyed after the swap, outside the reader lock
    std::unique_ptr<FlowState> old_state;
    std::unique_ptr<FlowController> old_controller;
    {
        std::lock_guard<std::mutex> session(impl_->session_mutex);
        old_controller = std::exchange(impl_->controller, std::move(controller));
        old_state = std::exchange(impl_->state, std::move(state));
    }

    impl_->gate->Reset();
    impl_->errors.ClearLastError();
    impl_->enabled.store(true, std::memory_order_release);
    status_ = Status::Running;

    if (impl_->log.info)
        impl_->log.info("Service connected, monitoring " + impl_->cfg.source_package + " and " +
                        impl_->cfg.companion_package);
}

void Engine::on_interrupt() { end_session("interrupted"); }

void Engine::on_unbind() { end_session("unbound"); }

void Engine::on_destroy() { end_session("destroyed"); }

void Engine::end_session(const char* reason)
{
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);

    impl_->enabled.store(false, std::memory_order_release);
    impl_->Quiesce();

    if (impl_->state)
    {
        impl_->state->EndCycle();
        impl_->state->Reset(impl_->clock->Now());
    }
    if (impl_->gate)
        impl_->gate->Reset();

    if (status_ != Status::Error)
        status_ = Status::Stopped;

    if (impl_->log.info)
        impl_->log.info(std::string("Service ") + reason);
    log_stats();
}

GateDecision Engine::on_change(const ChangeEvent& event)
{
    if (!impl_->enabled.load(std::memory_order_acquire))
        return GateDecision::ServiceDisabled;

    std::lock_guard<std::mutex> session(impl_->session_mutex);
    if (!impl_->gate)
        return GateDecision::ServiceDisabled;

    const GateDecision decision = impl_->gate->OnChange(event);
    if (impl_->cfg.verbose && impl_->log.debug)
        impl_->log.debug(std::string("Event ") + EventKindName(event.kind) + " from " + event.source + ": " +
                         GateDecisionName(decision));
    return decision;
}

bool Engine::service_enabled() const { return impl_->enabled.load(std::memory_order_acquire); }

Stats Engine::stats() const
{
    Stats out;
    {
        std::lock_guard<std::mutex> session(impl_->session_mutex);
        if (impl_->state)
        {
            const FlowStats flow = impl_->state->Stats();
            out.dialogs_detected = flow.dialogs_detected;
            out.auto_accept_count = flow.auto_accept_count;
            out.shares_completed = flow.shares_completed;
            out.step = flow.step;
        }
    }
    out.cycles_run = impl_->cycles_run.load(std::memory_order_relaxed);
    out.cycles_dropped = impl_->cycles_dropped.load(std::memory_order_relaxed);
    out.service_enabled = service_enabled();
    return out;
}

void Engine::log_stats() const
{
    if (!impl_->log.info)
        return;

    const Stats s = stats();
    std::ostringstream oss;
    oss << "Stats: dialogs detected=" << s.dialogs_detected << ", auto-accepted=" << s.auto_accept_count
        << ", shares completed=" << s.shares_completed << ", step=" << FlowStepName(s.step)
        << ", cycles=" << s.cycles_run << " (dropped " << s.cycles_dropped << ")"
        << ", service " << (s.service_enabled ? "enabled" : "disabled");
    impl_->log.info(oss.str());
}

std::string Engine::last_error() const { return impl_->errors.LastError(); }

std::size_t Engine::run_due_tasks()
{
    if (!impl_->scheduler)
        return 0;
    return impl_->scheduler->RunDue();
}

void Engine::wait_idle()
{
    if (impl_->worker)
        impl_->worker->wait();
}

std::optional<CycleResult> Engine::last_cycle() const
{
    std::lock_guard<std::mutex> lock(impl_->result_mutex);
    return impl_->last_result;
}

} // namespace deskpilot

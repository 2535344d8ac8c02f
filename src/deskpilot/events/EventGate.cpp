#include "EventGate.hpp"

#include <algorithm>
#include <utility>

namespace deskpilot
{

const char* GateDecisionName(GateDecision decision)
{
    switch (decision)
    {
    case GateDecision::ServiceDisabled:
        return "service-disabled";
    case GateDecision::DroppedForeign:
        return "dropped-foreign";
    case GateDecision::IgnoredKind:
        return "ignored-kind";
    case GateDecision::RateLimited:
        return "rate-limited";
    case GateDecision::Scheduled:
        return "scheduled";
    }
    return "unknown";
}

EventGate::EventGate(GateSettings settings, DeferredTaskScheduler& scheduler, IClock& clock, CycleLauncher launch)
    : settings_(std::move(settings))
    , scheduler_(scheduler)
    , clock_(clock)
    , launch_(std::move(launch))
{
}

std::optional<MonitoredApp> EventGate::Classify(const std::string& source) const
{
    if (!source.empty() && source == settings_.source_package)
        return MonitoredApp::Source;
    if (!source.empty() && source == settings_.companion_package)
        return MonitoredApp::Companion;
    return std::nullopt;
}

bool EventGate::IsTrigger(EventKind kind) const
{
    return std::find(settings_.trigger_kinds.begin(), settings_.trigger_kinds.end(), kind) !=
           settings_.trigger_kinds.end();
}

GateDecision EventGate::OnChange(const ChangeEvent& event)
{
    const auto app = Classify(event.source);
    if (!app)
        return GateDecision::DroppedForeign;

    if (!IsTrigger(event.kind))
        return GateDecision::IgnoredKind;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const TimePoint now = clock_.Now();
        if (last_trigger_ && now - *last_trigger_ < settings_.min_process_interval)
            return GateDecision::RateLimited;
        last_trigger_ = now;
    }

    const MonitoredApp target = *app;
    scheduler_.Schedule(TaskPurpose::SettleDelay, settings_.settle_delay, [this, target]() {
        if (launch_)
            launch_(target);
    });
    return GateDecision::Scheduled;
}

void EventGate::Reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    last_trigger_.reset();
}

} // namespace deskpilot

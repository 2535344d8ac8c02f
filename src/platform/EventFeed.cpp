#include "EventFeed.hpp"
#include "TreeDumpLoader.hpp"
#include "../utils/ErrorReporter.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <chrono>
#include <cstdint>
#include <optional>

using json = nlohmann::json;

namespace platform
{

namespace
{

constexpr std::int64_t kMaxWaitMs = 10 * 60 * 1000;

} // namespace

EventFeed::EventFeed(deskpilot::Engine& engine, deskpilot::MemoryUiTree& tree, deskpilot::IClock& clock)
    : engine_(engine)
    , tree_(tree)
    , clock_(clock)
{
}

bool EventFeed::applyLifecycle(const std::string& name, std::string& outError)
{
    if (name == "connected")
        engine_.on_connected();
    else if (name == "interrupt")
        engine_.on_interrupt();
    else if (name == "unbind")
        engine_.on_unbind();
    else if (name == "destroy")
        engine_.on_destroy();
    else
    {
        outError = "unknown lifecycle event '" + name + "'";
        return false;
    }
    ++counters_.lifecycle;
    return true;
}

bool EventFeed::dispatch(const json& obj, std::string& outError)
{
    if (!obj.is_object())
    {
        outError = "line is not a JSON object";
        return false;
    }

    // Checked before anything on the line takes effect
    std::optional<std::int64_t> wait_ms;
    if (obj.contains("wait_ms"))
    {
        const json& value = obj["wait_ms"];
        if (!value.is_number_integer())
        {
            outError = "'wait_ms' must be a whole number of milliseconds";
            return false;
        }
        wait_ms = value.get<std::int64_t>();
        if (*wait_ms < 0 || *wait_ms > kMaxWaitMs)
        {
            outError = "'wait_ms' must be between 0 and " + std::to_string(kMaxWaitMs);
            return false;
        }
    }

    bool handled = false;

    if (obj.contains("lifecycle"))
    {
        if (!applyLifecycle(obj["lifecycle"].get<std::string>(), outError))
            return false;
        handled = true;
    }

    if (obj.contains("package"))
    {
        const std::string package = obj["package"].get<std::string>();
        const std::string kind_name = obj.value("kind", "window_state_changed");
        const auto kind = deskpilot::ParseEventKind(kind_name);
        if (!kind)
        {
            outError = "unknown notification kind '" + kind_name + "'";
            return false;
        }

        if (obj.contains("tree"))
        {
            deskpilot::MemoryNode root;
            if (!TreeDumpLoader::parse(obj["tree"], root, outError))
                return false;
            tree_.SetActiveWindow(package, root);
        }

        ++counters_.notifications;
        const deskpilot::GateDecision decision = engine_.on_change(deskpilot::ChangeEvent{ package, *kind });
        if (decision == deskpilot::GateDecision::Scheduled)
            ++counters_.scheduled;
        PLOG_VERBOSE << "Notification " << kind_name << " from " << package << ": "
                     << deskpilot::GateDecisionName(decision);
        handled = true;
    }

    if (wait_ms)
    {
        clock_.SleepFor(std::chrono::milliseconds(*wait_ms));
        handled = true;
    }

    if (!handled)
    {
        outError = "expected 'package', 'lifecycle' or 'wait_ms'";
        return false;
    }
    return true;
}

bool EventFeed::processLine(const std::string& line, std::size_t line_number)
{
    if (line.empty() || line.find_first_not_of(" \t\r\n") == std::string::npos)
        return true;

    ++counters_.lines;
    std::string error;
    try
    {
        if (dispatch(json::parse(line), error))
            return true;
    }
    catch (const json::exception& e)
    {
        error = e.what();
    }

    ++counters_.skipped;
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::EventFeed, "Skipped malformed notification",
                                        "line " + std::to_string(line_number) + ": " + error);
    return false;
}

} // namespace platform

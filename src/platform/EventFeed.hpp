#pragma once

#include "deskpilot/api/deskpilot.hpp"
#include "deskpilot/tree/MemoryUiTree.hpp"
#include "deskpilot/util/Clock.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <string>

namespace platform
{

/**
 * @brief Replays JSON-lines UI notifications into the automation engine
 *
 * Each line is one object:
 *
 *   {"package": "com.android.systemui", "kind": "window_state_changed", "tree": {...}}
 *   {"lifecycle": "connected"}          connected | interrupt | unbind | destroy
 *   {"wait_ms": 600}                    let deferred work run (0..600000)
 *
 * A notification with a "tree" replaces the active window of the in-memory
 * tree before the engine sees it. "wait_ms" may also accompany a notification
 * and is honoured after it is dispatched. Malformed lines are reported under
 * ErrorCategory::EventFeed and skipped.
 */
class EventFeed
{
public:
    struct Counters
    {
        std::size_t lines = 0;
        std::size_t notifications = 0;
        std::size_t scheduled = 0;
        std::size_t lifecycle = 0;
        std::size_t skipped = 0;
    };

    EventFeed(deskpilot::Engine& engine, deskpilot::MemoryUiTree& tree, deskpilot::IClock& clock);

    /// @return false if the line was malformed and skipped
    bool processLine(const std::string& line, std::size_t line_number);

    const Counters& counters() const { return counters_; }

private:
    bool dispatch(const nlohmann::json& obj, std::string& outError);
    bool applyLifecycle(const std::string& name, std::string& outError);

    deskpilot::Engine& engine_;
    deskpilot::MemoryUiTree& tree_;
    deskpilot::IClock& clock_;
    Counters counters_;
};

} // namespace platform

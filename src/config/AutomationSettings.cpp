#include "AutomationSettings.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <limits>
#include <string>
#include <utility>

namespace
{

constexpr int64_t kMaxDelayMs = 10 * 60 * 1000;

void read_ms(const toml::table& t, const char* key, int& out, int64_t min_ms = 0)
{
    auto v = t[key].value<int64_t>();
    if (!v)
        return;
    if (*v < min_ms || *v > kMaxDelayMs)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            std::string("Ignoring out-of-range automation.") + key,
                                            "value " + std::to_string(*v) + " ms, keeping " + std::to_string(out));
        return;
    }
    out = static_cast<int>(*v);
}

void read_package(const toml::table& t, const char* key, std::string& out)
{
    auto v = t[key].value<std::string>();
    if (!v)
        return;
    if (v->empty())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            std::string("Ignoring empty automation.") + key, "keeping '" + out + "'");
        return;
    }
    out = *v;
}

} // namespace

void AutomationSettings::deserialize(const toml::table& t, deskpilot::Config& cfg)
{
    read_package(t, "source_package", cfg.source_package);
    read_package(t, "companion_package", cfg.companion_package);
    if (cfg.source_package == cfg.companion_package)
    {
        const deskpilot::Config defaults{};
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "automation.source_package and companion_package must differ",
                                            "both are '" + cfg.source_package + "', using the default packages");
        cfg.source_package = defaults.source_package;
        cfg.companion_package = defaults.companion_package;
    }

    read_ms(t, "min_process_interval_ms", cfg.min_process_interval_ms);
    read_ms(t, "settle_delay_ms", cfg.settle_delay_ms);
    read_ms(t, "stuck_timeout_ms", cfg.stuck_timeout_ms, 1);
    read_ms(t, "retry_delay_ms", cfg.retry_delay_ms);
    read_ms(t, "chooser_retry_delay_ms", cfg.chooser_retry_delay_ms);
    read_ms(t, "confirm_retry_delay_ms", cfg.confirm_retry_delay_ms);
    read_ms(t, "action_settle_ms", cfg.action_settle_ms);
    read_ms(t, "source_render_wait_ms", cfg.source_render_wait_ms);
    read_ms(t, "companion_render_wait_ms", cfg.companion_render_wait_ms);

    if (auto v = t["verbose"].value<bool>())
        cfg.verbose = *v;
    if (auto v = t["trigger_on_content_changes"].value<bool>())
        cfg.trigger_on_content_changes = *v;
}

toml::table AutomationSettings::serialize(const deskpilot::Config& cfg)
{
    toml::table t;
    t.insert("source_package", cfg.source_package);
    t.insert("companion_package", cfg.companion_package);
    t.insert("min_process_interval_ms", cfg.min_process_interval_ms);
    t.insert("settle_delay_ms", cfg.settle_delay_ms);
    t.insert("stuck_timeout_ms", cfg.stuck_timeout_ms);
    t.insert("retry_delay_ms", cfg.retry_delay_ms);
    t.insert("chooser_retry_delay_ms", cfg.chooser_retry_delay_ms);
    t.insert("confirm_retry_delay_ms", cfg.confirm_retry_delay_ms);
    t.insert("action_settle_ms", cfg.action_settle_ms);
    t.insert("source_render_wait_ms", cfg.source_render_wait_ms);
    t.insert("companion_render_wait_ms", cfg.companion_render_wait_ms);
    t.insert("verbose", cfg.verbose);
    t.insert("trigger_on_content_changes", cfg.trigger_on_content_changes);
    return t;
}

void AutomationSettings::registerConfigHandler(ConfigManager& config)
{
    TableCallbacks cb;
    cb.load = [this](const toml::table& section) {
        deskpilot::Config cfg{};
        deserialize(section, cfg);
        cfg_ = std::move(cfg);
        ++generation_;
    };
    cb.save = [this]() -> toml::table { return serialize(cfg_); };

    config.registerTable(kTablePath, std::move(cb),
                         { "source_package", "companion_package", "min_process_interval_ms", "settle_delay_ms",
                           "stuck_timeout_ms", "retry_delay_ms", "chooser_retry_delay_ms", "confirm_retry_delay_ms",
                           "action_settle_ms", "source_render_wait_ms", "companion_render_wait_ms", "verbose",
                           "trigger_on_content_changes" });
}

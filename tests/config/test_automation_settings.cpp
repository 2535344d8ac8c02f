#include <catch2/catch_test_macros.hpp>

#include "config/AutomationSettings.hpp"
#include "config/ConfigManager.hpp"
#include "utils/ErrorReporter.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace
{

class TempConfigFile
{
public:
    explicit TempConfigFile(const std::string& content)
        : path_("test_config_temp.toml")
    {
        std::ofstream file(path_);
        file << content;
    }

    ~TempConfigFile()
    {
        std::error_code ec;
        fs::remove(path_, ec);
        fs::remove(path_ + ".tmp", ec);
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace

TEST_CASE("AutomationSettings - Loading", "[config]")
{
    AutomationSettings settings;

    SECTION("Missing file keeps defaults")
    {
        ConfigManager config("missing_config_for_test.toml");
        settings.registerConfigHandler(config);
        REQUIRE(config.load());

        const deskpilot::Config& cfg = settings.engineConfig();
        REQUIRE(cfg.source_package == "com.anydesk.anydeskandroid");
        REQUIRE(cfg.companion_package == "com.android.systemui");
        REQUIRE(cfg.min_process_interval_ms == 800);
        REQUIRE(cfg.stuck_timeout_ms == 30000);
        REQUIRE(settings.generation() == 1);
    }

    SECTION("Values from the automation table")
    {
        TempConfigFile file(R"(
[automation]
source_package = "com.example.remote"
settle_delay_ms = 250
stuck_timeout_ms = 45000
verbose = true
trigger_on_content_changes = true
)");
        ConfigManager config(file.path());
        settings.registerConfigHandler(config);
        REQUIRE(config.load());

        const deskpilot::Config& cfg = settings.engineConfig();
        REQUIRE(cfg.source_package == "com.example.remote");
        REQUIRE(cfg.companion_package == "com.android.systemui");
        REQUIRE(cfg.settle_delay_ms == 250);
        REQUIRE(cfg.stuck_timeout_ms == 45000);
        REQUIRE(cfg.verbose);
        REQUIRE(cfg.trigger_on_content_changes);
    }

    SECTION("Out-of-range delays are reported and ignored")
    {
        TempConfigFile file(R"(
[automation]
retry_delay_ms = -1
confirm_retry_delay_ms = 99999999
)");
        const size_t before = utils::ErrorReporter::CountFor(utils::ErrorCategory::Configuration);

        ConfigManager config(file.path());
        settings.registerConfigHandler(config);
        REQUIRE(config.load());

        REQUIRE(settings.engineConfig().retry_delay_ms == 500);
        REQUIRE(settings.engineConfig().confirm_retry_delay_ms == 1000);
        REQUIRE(utils::ErrorReporter::CountFor(utils::ErrorCategory::Configuration) == before + 2);
    }

    SECTION("Values the engine would refuse keep their defaults")
    {
        TempConfigFile file(R"(
[automation]
stuck_timeout_ms = 0
companion_package = ""
min_process_interval_ms = 0
)");
        const size_t before = utils::ErrorReporter::CountFor(utils::ErrorCategory::Configuration);

        ConfigManager config(file.path());
        settings.registerConfigHandler(config);
        REQUIRE(config.load());

        const deskpilot::Config& cfg = settings.engineConfig();
        REQUIRE(cfg.stuck_timeout_ms == 30000);
        REQUIRE(cfg.companion_package == "com.android.systemui");
        REQUIRE(cfg.min_process_interval_ms == 0);
        REQUIRE(utils::ErrorReporter::CountFor(utils::ErrorCategory::Configuration) == before + 2);
        REQUIRE(deskpilot::Engine::validate(cfg).empty());
    }

    SECTION("Identical packages fall back to the default pair")
    {
        TempConfigFile file(R"(
[automation]
source_package = "com.example.remote"
companion_package = "com.example.remote"
)");
        ConfigManager config(file.path());
        settings.registerConfigHandler(config);
        REQUIRE(config.load());

        const deskpilot::Config& cfg = settings.engineConfig();
        REQUIRE(cfg.source_package == "com.anydesk.anydeskandroid");
        REQUIRE(cfg.companion_package == "com.android.systemui");
        REQUIRE(deskpilot::Engine::validate(cfg).empty());
    }

    SECTION("Broken TOML falls back to defaults")
    {
        TempConfigFile file("[automation\nsettle_delay_ms = 1\n");
        ConfigManager config(file.path());
        settings.registerConfigHandler(config);
        REQUIRE_FALSE(config.load());
        REQUIRE(settings.engineConfig().settle_delay_ms == 400);
        REQUIRE(std::string(config.lastError()).size() > 0);
    }
}

TEST_CASE("AutomationSettings - Saving", "[config]")
{
    TempConfigFile file(R"(
[global]
append_logs = false

[automation]
settle_delay_ms = 250
)");

    {
        AutomationSettings settings;
        ConfigManager config(file.path());
        settings.registerConfigHandler(config);
        REQUIRE(config.load());

        deskpilot::Config cfg = settings.engineConfig();
        cfg.retry_delay_ms = 650;
        settings.setEngineConfig(cfg);
        REQUIRE(config.save());
    }

    AutomationSettings reloaded;
    ConfigManager config(file.path());
    reloaded.registerConfigHandler(config);
    REQUIRE(config.load());

    REQUIRE(reloaded.engineConfig().settle_delay_ms == 250);
    REQUIRE(reloaded.engineConfig().retry_delay_ms == 650);
    // Keys nobody owns survive a save
    REQUIRE(config.root()["global"]["append_logs"].value<bool>() == false);
}

TEST_CASE("ErrorReporter - Queue and history", "[error_reporter]")
{
    utils::ErrorReporter::ClearErrors();
    utils::ErrorReporter::ClearHistory();

    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::EventFeed, "Skipped line", "line 3");
    utils::ErrorReporter::ReportError(utils::ErrorCategory::Automation, "Cycle aborted", "stale handle");

    REQUIRE(utils::ErrorReporter::HasPendingErrors());
    REQUIRE(utils::ErrorReporter::GetLastError().user_message == "Cycle aborted");
    REQUIRE(utils::ErrorReporter::CountFor(utils::ErrorCategory::Automation) == 1);

    const auto pending = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(pending.size() == 2);
    REQUIRE(pending[0].severity == utils::ErrorSeverity::Warning);
    REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());
    REQUIRE(utils::ErrorReporter::GetHistorySnapshot().size() == 2);
}

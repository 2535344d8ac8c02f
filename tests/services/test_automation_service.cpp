#include <catch2/catch_test_macros.hpp>

#include "services/AutomationService.hpp"
#include "utils/ErrorReporter.hpp"

#include "deskpilot/api/deskpilot.hpp"
#include "deskpilot/tree/MemoryUiTree.hpp"
#include "deskpilot/util/Clock.hpp"

using namespace deskpilot;

TEST_CASE("AutomationService - Configuration reload", "[service]")
{
    MemoryUiTree tree;
    ManualClock clock;
    AutomationService service(tree, &clock);

    Config cfg;
    cfg.run_scheduler_thread = false;
    REQUIRE(service.initialize(cfg));
    service.engine().on_connected();
    REQUIRE(service.engine().status() == Status::Running);

    SECTION("Valid settings reconnect the running session")
    {
        Config changed = cfg;
        changed.settle_delay_ms = 250;
        REQUIRE(service.reinitialize(changed));
        REQUIRE(service.engine().service_enabled());
        REQUIRE(service.engine().status() == Status::Running);
    }

    SECTION("Rejected settings leave the running session alone")
    {
        const size_t before = utils::ErrorReporter::CountFor(utils::ErrorCategory::Configuration);

        Config broken = cfg;
        broken.stuck_timeout_ms = 0;
        REQUIRE_FALSE(service.reinitialize(broken));

        REQUIRE(service.engine().service_enabled());
        REQUIRE(service.engine().status() == Status::Running);
        REQUIRE(utils::ErrorReporter::CountFor(utils::ErrorCategory::Configuration) == before + 1);

        broken = cfg;
        broken.companion_package = broken.source_package;
        REQUIRE_FALSE(service.reinitialize(broken));
        REQUIRE(service.engine().service_enabled());
    }

    service.shutdown();
    REQUIRE_FALSE(service.engine().service_enabled());
}

#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "open_url_handler.hpp"

using namespace std::chrono_literals;

TEST_CASE("Open-URL callback", "[open_url]") {
    ManualScheduler scheduler;
    RecordingEventBus bus(scheduler);
    OpenUrlHandler handler("app", bus);

    SECTION("FirstUrlPublishedOnce") {
        REQUIRE(handler.on_open_url({"app://one", "app://two"}));
        scheduler.advance(5s);
        REQUIRE(bus.emissions.size() == 1);
        REQUIRE(bus.emissions[0].event == "deep-link");
        REQUIRE(bus.emissions[0].payload == "app://one");
    }

    SECTION("EmptyListIsNoOp") {
        REQUIRE_FALSE(handler.on_open_url({}));
        REQUIRE(bus.emissions.empty());
    }

    SECTION("OpenUrlForeignSchemeIgnored") {
        REQUIRE_FALSE(handler.on_open_url({"http://not-ours"}));
        REQUIRE(bus.emissions.empty());
    }

    SECTION("OnlyFirstUrlIsConsidered") {
        // A matching URL later in the list does not rescue a foreign first one.
        REQUIRE_FALSE(handler.on_open_url({"http://not-ours", "app://two"}));
        REQUIRE(bus.emissions.empty());
    }

    SECTION("PublishFailureReported") {
        bus.fail = true;
        REQUIRE_FALSE(handler.on_open_url({"app://one"}));
        REQUIRE(bus.emissions.size() == 1);
    }
}

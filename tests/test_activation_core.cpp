#include <catch2/catch_test_macros.hpp>

#include "activation_core.hpp"
#include "fakes.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

struct Harness {
    ManualScheduler scheduler;
    RecordingEventBus bus{scheduler};
    FakeWindowManager window;
    FakeShortcutRegistry shortcuts;
    ActivationCore core{Config{}, false, bus, scheduler, window};

    json send(const json& cmd) {
        return core.handle_command(cmd.value("cmd", ""), cmd);
    }
};

} // namespace

TEST_CASE("ActivationCore", "[core]") {
    Harness h;

    SECTION("ColdStartThenHandshake") {
        REQUIRE(h.core.init({"prog", "app://open?id=42"}, h.shortcuts));

        auto first = h.send({{"cmd", "frontend_ready"}});
        REQUIRE(first["status"] == "ok");
        REQUIRE(first["url"] == "app://open?id=42");

        auto second = h.send({{"cmd", "frontend_ready"}});
        REQUIRE(second["status"] == "ok");
        REQUIRE(second["url"].is_null());

        // Cold start never pushes events.
        REQUIRE(h.bus.emissions.empty());
    }

    SECTION("ColdStartIgnoresForeignScheme") {
        REQUIRE(h.core.init({"prog", "notascheme://x"}, h.shortcuts));
        auto resp = h.send({{"cmd", "frontend_ready"}});
        REQUIRE(resp["url"].is_null());
    }

    SECTION("ShortcutRegistrationFailureFailsInit") {
        h.shortcuts.fail = true;
        REQUIRE_FALSE(h.core.init({"prog"}, h.shortcuts));
    }

    SECTION("ShortcutPressTogglesWindow") {
        REQUIRE(h.core.init({"prog"}, h.shortcuts));
        h.window.visible = true;
        h.shortcuts.press();
        REQUIRE_FALSE(h.window.visible);
    }

    SECTION("ForwardPublishesWithRetries") {
        auto resp = h.send({{"cmd", "forward"},
                            {"args", {"prog", "app://open?id=3"}},
                            {"cwd", "/tmp"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["forwarded"] == true);
        REQUIRE(h.bus.emissions.size() == 1);

        h.scheduler.advance(1500ms);
        REQUIRE(h.bus.emissions.size() == 3);
        REQUIRE(h.window.focuses == 1);
    }

    SECTION("ForwardDoesNotTouchPendingUrl") {
        h.send({{"cmd", "forward"}, {"args", {"prog", "app://live"}}});
        auto resp = h.send({{"cmd", "frontend_ready"}});
        REQUIRE(resp["url"].is_null());
    }

    SECTION("ForwardWithMalformedArgs") {
        auto resp = h.send({{"cmd", "forward"}, {"args", "app://x"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["forwarded"] == false);
        REQUIRE(h.bus.emissions.empty());
        REQUIRE(h.window.shows == 1);
    }

    SECTION("ForwardNonMatching") {
        auto resp = h.send({{"cmd", "forward"}, {"args", {"prog", "http://not-ours"}}});
        REQUIRE(resp["forwarded"] == false);
        h.scheduler.advance(2s);
        REQUIRE(h.bus.emissions.empty());
        REQUIRE(h.window.shows == 1);
    }

    SECTION("OpenUrlPublishesFirstOnly") {
        auto resp = h.send({{"cmd", "open_url"}, {"urls", {"app://a", "app://b"}}});
        REQUIRE(resp["published"] == true);
        h.scheduler.advance(2s);
        REQUIRE(h.bus.emissions.size() == 1);
        REQUIRE(h.bus.emissions[0].payload == "app://a");
    }

    SECTION("OpenUrlForeignSchemeIgnored") {
        auto resp = h.send({{"cmd", "open_url"}, {"urls", json::array({"http://not-ours"})}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["published"] == false);
        h.scheduler.advance(2s);
        REQUIRE(h.bus.emissions.empty());
    }

    SECTION("OpenUrlWithoutUrls") {
        auto resp = h.send({{"cmd", "open_url"}});
        REQUIRE(resp["published"] == false);
        REQUIRE(h.bus.emissions.empty());
    }

    SECTION("SubscribeIsAcknowledged") {
        auto resp = h.send({{"cmd", "subscribe"}});
        REQUIRE(resp["status"] == "subscribed");
    }

    SECTION("ToggleCommand") {
        h.window.visible = false;
        auto resp = h.send({{"cmd", "toggle"}});
        REQUIRE(resp["window"] == "shown");
        resp = h.send({{"cmd", "toggle"}});
        REQUIRE(resp["window"] == "hidden");
    }

    SECTION("Status") {
        auto resp = h.send({{"cmd", "status"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["scheme"] == "app");
        REQUIRE(resp["event"] == "deep-link");
    }

    SECTION("UnknownCommand") {
        auto resp = h.send({{"cmd", "explode"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["message"] == "unknown command");
    }
}

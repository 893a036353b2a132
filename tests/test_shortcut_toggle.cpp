#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "shortcut_toggle.hpp"

TEST_CASE("Shortcut toggle", "[shortcut]") {
    FakeWindowManager window;
    ShortcutToggle toggle(window);

    SECTION("VisibleBecomesHidden") {
        window.visible = true;
        REQUIRE(toggle.on_trigger() == ToggleAction::Hidden);
        REQUIRE_FALSE(window.visible);
        REQUIRE(window.hides == 1);
        REQUIRE(window.shows == 0);
    }

    SECTION("HiddenBecomesVisibleAndFocused") {
        window.visible = false;
        REQUIRE(toggle.on_trigger() == ToggleAction::Shown);
        REQUIRE(window.visible);
        REQUIRE(window.shows == 1);
        REQUIRE(window.focuses == 1);
    }

    SECTION("FailedQueryShows") {
        window.visible = true;
        window.fail_query = true;
        REQUIRE(toggle.on_trigger() == ToggleAction::Shown);
        REQUIRE(window.shows == 1);
        REQUIRE(window.hides == 0);
    }

    SECTION("RepeatedTriggersAlternate") {
        window.visible = true;
        REQUIRE(toggle.on_trigger() == ToggleAction::Hidden);
        REQUIRE(toggle.on_trigger() == ToggleAction::Shown);
        REQUIRE(toggle.on_trigger() == ToggleAction::Hidden);
        REQUIRE(window.queries == 3);
    }

    SECTION("StateQueriedLiveEachTime") {
        window.visible = true;
        REQUIRE(toggle.on_trigger() == ToggleAction::Hidden);
        // Someone else showed the window in between.
        window.visible = true;
        REQUIRE(toggle.on_trigger() == ToggleAction::Hidden);
    }

    SECTION("InstallRegistersPrimaryShiftP") {
        FakeShortcutRegistry registry;
        REQUIRE(toggle.install(registry));
        REQUIRE((registry.binding.modifiers & ModShift) != 0);
        REQUIRE(registry.binding.key == 'P');

        window.visible = true;
        registry.press();
        REQUIRE_FALSE(window.visible);
        registry.press();
        REQUIRE(window.visible);
    }

    SECTION("InstallFailureIsReported") {
        FakeShortcutRegistry registry;
        registry.fail = true;
        auto res = toggle.install(registry);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().find("binding already taken") != std::string::npos);
    }
}

TEST_CASE("ShortcutBinding", "[shortcut]") {
    SECTION("SwaySyntax") {
        ShortcutBinding b{.modifiers = ModCtrl | ModShift, .key = 'P'};
        REQUIRE(b.to_string() == "Ctrl+Shift+p");
    }

    SECTION("SuperUsesMod4") {
        ShortcutBinding b{.modifiers = ModSuper | ModShift, .key = 'P'};
        REQUIRE(b.to_string() == "Mod4+Shift+p");
    }

#ifndef __APPLE__
    SECTION("DefaultIsCtrlShiftP") {
        REQUIRE(ShortcutBinding::toggle_window().to_string() == "Ctrl+Shift+p");
    }
#endif
}

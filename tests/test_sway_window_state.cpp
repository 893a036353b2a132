#include <catch2/catch_test_macros.hpp>

#include "sway/window_state.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

json sample_tree() {
    return json::parse(R"({
        "id": 1, "type": "root", "nodes": [
            { "id": 2, "type": "output", "name": "__i3", "nodes": [
                { "id": 3, "type": "workspace", "name": "__i3_scratch", "nodes": [],
                  "floating_nodes": [
                    { "id": 40, "type": "floating_con", "app_id": "notes",
                      "name": "Notes", "visible": false, "focused": false }
                  ] }
            ] },
            { "id": 5, "type": "output", "name": "DP-1", "nodes": [
                { "id": 6, "type": "workspace", "name": "1", "nodes": [
                    { "id": 7, "type": "con", "app_id": "kitty", "name": "shell",
                      "visible": true, "focused": false },
                    { "id": 8, "type": "con", "app_id": "linkrelay-ui", "name": "Vault",
                      "visible": true, "focused": true }
                ] }
            ] }
        ]
    })");
}

} // namespace

TEST_CASE("Sway window lookup", "[sway]") {
    auto tree = sample_tree();

    SECTION("FindsVisibleWindow") {
        auto w = find_window(tree, "linkrelay-ui");
        REQUIRE(w.found());
        REQUIRE(w.con_id == 8);
        REQUIRE(w.app_id == "linkrelay-ui");
        REQUIRE(w.visible);
    }

    SECTION("FindsScratchpadWindowAsHidden") {
        auto w = find_window(tree, "notes");
        REQUIRE(w.found());
        REQUIRE(w.con_id == 40);
        REQUIRE_FALSE(w.visible);
    }

    SECTION("MissingWindow") {
        auto w = find_window(tree, "firefox");
        REQUIRE_FALSE(w.found());
    }

    SECTION("NullAppIdIgnored") {
        auto t = json::parse(R"({ "id": 1, "nodes": [ { "id": 2, "app_id": null } ] })");
        REQUIRE_FALSE(find_window(t, "linkrelay-ui").found());
    }

    SECTION("CriteriaQuoting") {
        REQUIRE(app_id_criteria("linkrelay-ui") == R"([app_id="linkrelay-ui"])");
        REQUIRE(app_id_criteria(R"(we"ird)") == R"([app_id="we\"ird"])");
    }
}

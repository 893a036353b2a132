#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

struct WindowState {
    int64_t con_id = 0;     // sway container id, 0 if not found
    std::string app_id;     // Wayland app_id
    bool visible = false;   // mapped on a visible workspace

    bool found() const { return con_id != 0; }
};

// Depth-first search of a GET_TREE reply for the first view with `app_id`.
WindowState find_window(const nlohmann::json& node, std::string_view app_id);

// Criteria selecting windows by app_id, e.g. [app_id="linkrelay-ui"].
std::string app_id_criteria(std::string_view app_id);

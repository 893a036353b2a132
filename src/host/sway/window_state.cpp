#include "sway/window_state.hpp"

namespace {

// sway reports null for unset fields, which json::value() rejects.
template <typename T>
T field(const nlohmann::json& node, const char* key, T fallback) {
    if (!node.contains(key) || node[key].is_null()) return fallback;
    return node[key].get<T>();
}

} // namespace

WindowState find_window(const nlohmann::json& node, std::string_view app_id) {
    if (node.is_object() && node.contains("app_id") && node["app_id"].is_string() &&
        node["app_id"].get<std::string>() == app_id) {
        WindowState state;
        state.con_id = field<int64_t>(node, "id", 0);
        state.app_id = std::string(app_id);
        state.visible = field<bool>(node, "visible", false);
        return state;
    }

    for (const char* key : {"nodes", "floating_nodes"}) {
        if (!node.contains(key)) continue;
        for (auto& child : node[key]) {
            auto state = find_window(child, app_id);
            if (state.found()) return state;
        }
    }
    return {};
}

std::string app_id_criteria(std::string_view app_id) {
    std::string out = "[app_id=\"";
    for (char c : app_id) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += "\"]";
    return out;
}

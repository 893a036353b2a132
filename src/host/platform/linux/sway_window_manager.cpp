#include "platform/linux/sway_window_manager.hpp"

#include <cstdlib>
#include <print>

SwayWindowManager::SwayWindowManager(std::string app_id) : app_id_(std::move(app_id)) {}

SwayWindowManager::~SwayWindowManager() = default;

bool SwayWindowManager::connect() {
    const char* sock = std::getenv("SWAYSOCK");
    if (!sock) {
        std::println(stderr, "sway: $SWAYSOCK not set");
        return false;
    }
    sway_sock_ = sock;
    return query_.connect(sway_sock_);
}

std::expected<WindowState, std::string> SwayWindowManager::query_window() {
    auto tree = query_.request(SwayIpc::MSG_GET_TREE);
    if (!tree) return std::unexpected(tree.error());

    WindowState state;
    try {
        state = find_window(*tree, app_id_);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string("unexpected tree layout: ") + e.what());
    }
    if (!state.found()) return std::unexpected("no window with app_id " + app_id_);
    return state;
}

std::expected<bool, std::string> SwayWindowManager::is_visible() {
    auto state = query_window();
    if (!state) return std::unexpected(state.error());
    return state->visible;
}

std::expected<void, std::string> SwayWindowManager::show() {
    auto state = query_window();
    if (!state) return std::unexpected(state.error());
    // scratchpad show toggles, so only use it on a hidden window
    if (state->visible) return {};
    return query_.run_command(app_id_criteria(app_id_) + " scratchpad show");
}

std::expected<void, std::string> SwayWindowManager::hide() {
    return query_.run_command(app_id_criteria(app_id_) + " move scratchpad");
}

std::expected<void, std::string> SwayWindowManager::focus() {
    return query_.run_command(app_id_criteria(app_id_) + " focus");
}

std::expected<void, std::string> SwayWindowManager::register_shortcut(
        const ShortcutBinding& binding, Handler handler) {
    if (query_.fd() < 0) return std::unexpected("not connected to sway");

    if (events_.fd() < 0) {
        if (!events_.connect(sway_sock_)) return std::unexpected("event connection failed");
        auto reply = events_.request(SwayIpc::MSG_SUBSCRIBE, R"(["binding"])");
        if (!reply) {
            events_.close();
            return std::unexpected("subscribe failed: " + reply.error());
        }
        if (!reply->is_object() || !reply->value("success", false)) {
            events_.close();
            return std::unexpected("subscribe to binding events rejected");
        }
    }

    auto res = query_.run_command("bindsym --no-repeat " + binding.to_string() + " " +
                                  TOGGLE_COMMAND);
    if (!res) return std::unexpected(res.error());

    handler_ = std::move(handler);
    return {};
}

bool SwayWindowManager::read_event() {
    uint32_t type;
    std::string payload;
    if (!events_.recv_message(type, payload)) {
        events_.close();
        return false;
    }

    if (type != SwayIpc::EVENT_BINDING) return true;

    try {
        auto j = nlohmann::json::parse(payload);
        if (j.value("change", "") != "run") return true;
        auto command = j.contains("binding") ? j["binding"].value("command", "") : "";
        if (command == TOGGLE_COMMAND && handler_) {
            handler_();
        }
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "sway: bad binding event: {}", e.what());
    }
    return true;
}

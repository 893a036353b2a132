#include "activation_core.hpp"

#include "cold_start.hpp"
#include "deep_link.hpp"
#include "log.hpp"
#include "readiness_handshake.hpp"

#include <print>

namespace {

// Reads an array of strings; anything malformed counts as absent.
std::vector<std::string> string_list(const nlohmann::json& cmd, const char* key) {
    std::vector<std::string> out;
    if (!cmd.contains(key)) return out;

    const auto& arr = cmd[key];
    if (!arr.is_array()) {
        std::println(stderr, "core: '{}' is not an array, ignoring", key);
        return out;
    }
    for (const auto& item : arr) {
        if (!item.is_string()) {
            std::println(stderr, "core: non-string entry in '{}', ignoring", key);
            return {};
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace

ActivationCore::ActivationCore(Config config, bool verbose,
                               EventBus& bus, Scheduler& scheduler, WindowManager& window)
    : config_(std::move(config)), verbose_(verbose),
      forwarder_(config_.deep_link.scheme, bus, scheduler, window, verbose_),
      open_url_(config_.deep_link.scheme, bus, verbose_),
      toggle_(window, verbose_) {}

bool ActivationCore::init(const std::vector<std::string>& launch_args,
                          ShortcutRegistry& shortcuts) {
    inspect_launch_args(launch_args, config_.deep_link.scheme, pending_, verbose_);

    auto res = toggle_.install(shortcuts);
    if (!res) {
        std::println(stderr, "shortcut: {}", res.error());
        return false;
    }

    log("Accepting " + config_.deep_link.scheme + ":// links, window app_id " +
        config_.window.app_id);
    return true;
}

nlohmann::json ActivationCore::handle_command(const std::string& cmd_str,
                                              const nlohmann::json& cmd) {
    if (cmd_str == "forward") return handle_forward(cmd);
    if (cmd_str == "open_url") return handle_open_url(cmd);
    if (cmd_str == "frontend_ready") return handle_frontend_ready(cmd);
    if (cmd_str == "subscribe") return {{"status", "subscribed"}};
    if (cmd_str == "toggle") return handle_toggle(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    return {{"status", "error"}, {"message", "unknown command"}};
}

nlohmann::json ActivationCore::handle_forward(const nlohmann::json& cmd) {
    auto args = string_list(cmd, "args");
    auto cwd = cmd.contains("cwd") && cmd["cwd"].is_string() ? cmd["cwd"].get<std::string>()
                                                              : std::string();
    bool forwarded = forwarder_.on_second_instance(args, cwd);
    return {{"status", "ok"}, {"forwarded", forwarded}};
}

nlohmann::json ActivationCore::handle_open_url(const nlohmann::json& cmd) {
    auto urls = string_list(cmd, "urls");
    bool published = open_url_.on_open_url(urls);
    return {{"status", "ok"}, {"published", published}};
}

nlohmann::json ActivationCore::handle_frontend_ready(const nlohmann::json& /*cmd*/) {
    auto url = frontend_ready(pending_, verbose_);
    nlohmann::json resp = {{"status", "ok"}};
    resp["url"] = url ? nlohmann::json(*url) : nlohmann::json(nullptr);
    return resp;
}

nlohmann::json ActivationCore::handle_toggle(const nlohmann::json& /*cmd*/) {
    auto action = toggle_.on_trigger();
    return {{"status", "ok"}, {"window", action == ToggleAction::Shown ? "shown" : "hidden"}};
}

nlohmann::json ActivationCore::handle_status(const nlohmann::json& /*cmd*/) {
    return {
        {"status", "ok"},
        {"scheme", config_.deep_link.scheme},
        {"event", std::string(deep_link::kEventName)},
        {"shortcut", ShortcutBinding::toggle_window().to_string()},
    };
}

void ActivationCore::log(const std::string& msg) {
    log_info(verbose_, msg);
}

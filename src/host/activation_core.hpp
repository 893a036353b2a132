#pragma once

#include "config.hpp"
#include "open_url_handler.hpp"
#include "pending_url_store.hpp"
#include "platform/event_bus.hpp"
#include "platform/scheduler.hpp"
#include "platform/shortcut_registry.hpp"
#include "platform/window_manager.hpp"
#include "shortcut_toggle.hpp"
#include "single_instance_forwarder.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Portable activation logic: owns the pending URL and the handlers for
// every way a deep link can arrive. Platform pieces are injected.
class ActivationCore {
public:
    ActivationCore(Config config, bool verbose,
                   EventBus& bus, Scheduler& scheduler, WindowManager& window);

    ActivationCore(const ActivationCore&) = delete;
    ActivationCore& operator=(const ActivationCore&) = delete;

    // Buffers a cold-start deep link from `launch_args` and registers the
    // window toggle shortcut. Only the shortcut can fail setup.
    bool init(const std::vector<std::string>& launch_args, ShortcutRegistry& shortcuts);

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    const Config& config() const { return config_; }

private:
    nlohmann::json handle_forward(const nlohmann::json& cmd);
    nlohmann::json handle_open_url(const nlohmann::json& cmd);
    nlohmann::json handle_frontend_ready(const nlohmann::json& cmd);
    nlohmann::json handle_toggle(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    PendingUrlStore pending_;
    SingleInstanceForwarder forwarder_;
    OpenUrlHandler open_url_;
    ShortcutToggle toggle_;
};

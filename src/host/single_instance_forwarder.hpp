#pragma once

#include "platform/event_bus.hpp"
#include "platform/scheduler.hpp"
#include "platform/window_manager.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

// Handles a second launch of the application while this instance runs.
// A matching deep link is published at once and again after the retry
// delays, since the UI may not have attached its listener yet. The main
// window is raised either way.
class SingleInstanceForwarder {
public:
    // Delay of each retry, counted from the previous publish.
    static constexpr std::chrono::milliseconds kFirstRetry{500};
    static constexpr std::chrono::milliseconds kSecondRetry{1000};

    SingleInstanceForwarder(std::string scheme, EventBus& bus, Scheduler& scheduler,
                            WindowManager& window, bool verbose = false);

    // `cwd` is the working directory of the second launch; unused.
    // Returns true if a deep link was forwarded.
    bool on_second_instance(const std::vector<std::string>& args, const std::string& cwd);

private:
    void publish(const std::string& url, std::string_view when);
    void raise_window();
    void log(const std::string& msg);

    std::string scheme_;
    EventBus& bus_;
    Scheduler& scheduler_;
    WindowManager& window_;
    bool verbose_;
};

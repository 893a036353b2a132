#pragma once

#include "platform/event_bus.hpp"

#include <string>
#include <vector>

// Activation pushed by the OS while the app is running. The UI is assumed
// live, so the first URL is published directly with no buffering. Any
// local client can push here, so the scheme is checked like every other
// entry point.
class OpenUrlHandler {
public:
    OpenUrlHandler(std::string scheme, EventBus& bus, bool verbose = false);

    // Returns true if a URL was published.
    bool on_open_url(const std::vector<std::string>& urls);

private:
    std::string scheme_;
    EventBus& bus_;
    bool verbose_;
};

#pragma once

#include "platform/shortcut_registry.hpp"
#include "platform/window_manager.hpp"

#include <expected>
#include <string>

enum class ToggleAction { Hidden, Shown };

// Global hotkey that flips main-window visibility. State is never cached:
// each trigger asks the window manager.
class ShortcutToggle {
public:
    explicit ShortcutToggle(WindowManager& window, bool verbose = false);

    // Registers the build-time binding. Failure must stop startup.
    std::expected<void, std::string> install(ShortcutRegistry& registry);

    ToggleAction on_trigger();

private:
    WindowManager& window_;
    bool verbose_;
};

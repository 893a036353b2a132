#pragma once

#include <expected>
#include <string>

// Show/hide/focus primitives for the application's main window.
// Visibility is owned by the window manager and queried live.
class WindowManager {
public:
    virtual ~WindowManager() = default;
    virtual bool connect() = 0;
    virtual std::expected<bool, std::string> is_visible() = 0;
    virtual std::expected<void, std::string> show() = 0;
    virtual std::expected<void, std::string> hide() = 0;
    virtual std::expected<void, std::string> focus() = 0;
};

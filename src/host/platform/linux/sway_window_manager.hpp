#pragma once

#include "platform/shortcut_registry.hpp"
#include "platform/window_manager.hpp"
#include "sway/ipc.hpp"
#include "sway/window_state.hpp"

#include <string>

// Main window control and global shortcuts through sway.
// Hidden means parked in the scratchpad.
class SwayWindowManager : public WindowManager, public ShortcutRegistry {
public:
    explicit SwayWindowManager(std::string app_id);
    ~SwayWindowManager() override;

    SwayWindowManager(const SwayWindowManager&) = delete;
    SwayWindowManager& operator=(const SwayWindowManager&) = delete;

    bool connect() override;
    std::expected<bool, std::string> is_visible() override;
    std::expected<void, std::string> show() override;
    std::expected<void, std::string> hide() override;
    std::expected<void, std::string> focus() override;

    std::expected<void, std::string> register_shortcut(const ShortcutBinding& binding,
                                                       Handler handler) override;

    // Socket carrying binding events, -1 until a shortcut is registered.
    int event_fd() const { return events_.fd(); }
    // Reads one event and runs the shortcut handler if it matches.
    // Returns false if the event connection is gone.
    bool read_event();

private:
    static constexpr char TOGGLE_COMMAND[] = "nop linkrelay-toggle";

    std::expected<WindowState, std::string> query_window();

    std::string app_id_;
    std::string sway_sock_;
    SwayIpc query_;
    SwayIpc events_;
    Handler handler_;
};

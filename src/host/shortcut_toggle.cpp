#include "shortcut_toggle.hpp"

#include "log.hpp"

#include <print>

ShortcutToggle::ShortcutToggle(WindowManager& window, bool verbose)
    : window_(window), verbose_(verbose) {}

std::expected<void, std::string> ShortcutToggle::install(ShortcutRegistry& registry) {
    auto binding = ShortcutBinding::toggle_window();
    auto res = registry.register_shortcut(binding, [this] { on_trigger(); });
    if (!res) {
        return std::unexpected("failed to register " + binding.to_string() + ": " + res.error());
    }
    log_info(verbose_, "Registered window toggle shortcut " + binding.to_string());
    return {};
}

ToggleAction ShortcutToggle::on_trigger() {
    auto visible = window_.is_visible();
    if (!visible) {
        std::println(stderr, "shortcut: visibility query failed, showing window: {}",
                     visible.error());
    }

    if (visible.value_or(false)) {
        if (auto res = window_.hide(); !res) {
            std::println(stderr, "shortcut: hide failed: {}", res.error());
        }
        log_info(verbose_, "Main window hidden");
        return ToggleAction::Hidden;
    }

    if (auto res = window_.show(); !res) {
        std::println(stderr, "shortcut: show failed: {}", res.error());
    }
    if (auto res = window_.focus(); !res) {
        std::println(stderr, "shortcut: focus failed: {}", res.error());
    }
    log_info(verbose_, "Main window shown");
    return ToggleAction::Shown;
}

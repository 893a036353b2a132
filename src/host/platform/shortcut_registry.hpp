#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <string>

enum Modifier : uint8_t {
    ModNone  = 0,
    ModCtrl  = 1 << 0,
    ModShift = 1 << 1,
    ModAlt   = 1 << 2,
    ModSuper = 1 << 3,
};

struct ShortcutBinding {
    uint8_t modifiers = ModNone;
    char key = 0;

    // e.g. "Ctrl+Shift+p"
    std::string to_string() const;

    // Primary modifier + Shift + P. Fixed at build time.
    static ShortcutBinding toggle_window();
};

class ShortcutRegistry {
public:
    using Handler = std::function<void()>;

    virtual ~ShortcutRegistry() = default;
    virtual std::expected<void, std::string> register_shortcut(const ShortcutBinding& binding,
                                                               Handler handler) = 0;
};

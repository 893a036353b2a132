#include "platform/shortcut_registry.hpp"

#include <cctype>

std::string ShortcutBinding::to_string() const {
    std::string out;
    if (modifiers & ModSuper) out += "Mod4+";
    if (modifiers & ModCtrl) out += "Ctrl+";
    if (modifiers & ModAlt) out += "Mod1+";
    if (modifiers & ModShift) out += "Shift+";
    out += static_cast<char>(std::tolower(static_cast<unsigned char>(key)));
    return out;
}

ShortcutBinding ShortcutBinding::toggle_window() {
#ifdef __APPLE__
    return {.modifiers = ModSuper | ModShift, .key = 'P'};
#else
    return {.modifiers = ModCtrl | ModShift, .key = 'P'};
#endif
}

#pragma once

#include <string>
#include <string_view>

namespace deep_link {

// Event identifier the UI subscribes to for every activation.
inline constexpr std::string_view kEventName = "deep-link";

// True if `arg` starts with "<scheme>://".
inline bool matches_scheme(std::string_view arg, std::string_view scheme) {
    if (scheme.empty()) return false;
    return arg.size() >= scheme.size() + 3 &&
           arg.starts_with(scheme) &&
           arg.substr(scheme.size(), 3) == "://";
}

} // namespace deep_link

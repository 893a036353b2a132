#pragma once

#include <print>
#include <string_view>

// Informational output, shown only with --verbose. Errors and warnings go
// straight to stderr with a "<component>: " prefix instead.
inline void log_info(bool verbose, std::string_view msg) {
    if (verbose) {
        std::println(stderr, "[linkrelay] {}", msg);
    }
}

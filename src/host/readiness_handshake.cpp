#include "readiness_handshake.hpp"

#include "log.hpp"

std::optional<std::string> frontend_ready(PendingUrlStore& store, bool verbose) {
    log_info(verbose, "[DeepLink] Frontend ready command called");

    auto url = store.take();
    if (url) {
        log_info(verbose, "[DeepLink] Returning pending URL: " + *url);
    } else {
        log_info(verbose, "[DeepLink] No pending URL to return");
    }
    return url;
}

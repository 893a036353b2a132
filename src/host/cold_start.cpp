#include "cold_start.hpp"

#include "deep_link.hpp"
#include "log.hpp"

#include <format>

bool inspect_launch_args(const std::vector<std::string>& args, const std::string& scheme,
                         PendingUrlStore& store, bool verbose) {
    if (verbose) {
        std::string joined;
        for (const auto& a : args) {
            if (!joined.empty()) joined += ' ';
            joined += a;
        }
        log_info(verbose, "[DeepLink] CLI args: " + joined);
    }

    if (args.size() < 2) {
        log_info(verbose, "[DeepLink] No URL argument found");
        return false;
    }

    const auto& url = args[1];
    if (!deep_link::matches_scheme(url, scheme)) {
        log_info(verbose, std::format("[DeepLink] {} is not a {}:// link, ignoring", url, scheme));
        return false;
    }

    log_info(verbose, "[DeepLink] Cold start with URL, storing for later: " + url);
    return store.set(url);
}

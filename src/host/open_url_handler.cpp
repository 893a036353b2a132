#include "open_url_handler.hpp"

#include "deep_link.hpp"
#include "log.hpp"

#include <print>

OpenUrlHandler::OpenUrlHandler(std::string scheme, EventBus& bus, bool verbose)
    : scheme_(std::move(scheme)), bus_(bus), verbose_(verbose) {}

bool OpenUrlHandler::on_open_url(const std::vector<std::string>& urls) {
    if (urls.empty()) return false;

    const auto& url = urls.front();
    if (!deep_link::matches_scheme(url, scheme_)) {
        log_info(verbose_, "[DeepLink] Ignoring non-deep-link open-url: " + url);
        return false;
    }

    log_info(verbose_, "[DeepLink] onOpenUrl: " + url);

    auto res = bus_.emit(std::string(deep_link::kEventName), url);
    if (!res) {
        std::println(stderr, "open-url: emit failed: {}", res.error());
        return false;
    }
    return true;
}

#include "single_instance_forwarder.hpp"

#include "deep_link.hpp"
#include "log.hpp"

#include <format>
#include <print>

SingleInstanceForwarder::SingleInstanceForwarder(std::string scheme, EventBus& bus,
                                                 Scheduler& scheduler, WindowManager& window,
                                                 bool verbose)
    : scheme_(std::move(scheme)), bus_(bus), scheduler_(scheduler),
      window_(window), verbose_(verbose) {}

bool SingleInstanceForwarder::on_second_instance(const std::vector<std::string>& args,
                                                 const std::string& /*cwd*/) {
    bool forwarded = false;

    if (args.size() < 2) {
        log("[SingleInstance] No arguments found");
    } else if (!deep_link::matches_scheme(args[1], scheme_)) {
        log("[SingleInstance] Ignoring non-deep-link arg: " + args[1]);
    } else {
        const auto& url = args[1];
        log("[SingleInstance] Forwarding deep link: " + url);
        publish(url, "immediate");

        // Retries are not cancellable; they fire even if the URL was
        // already consumed. The UI treats repeats as re-deliveries.
        scheduler_.schedule_after(kFirstRetry, [this, url] {
            publish(url, std::format("{}ms delay", kFirstRetry.count()));
            scheduler_.schedule_after(kSecondRetry, [this, url] {
                publish(url, std::format("{}ms delay", (kFirstRetry + kSecondRetry).count()));
            });
        });
        forwarded = true;
    }

    raise_window();
    return forwarded;
}

void SingleInstanceForwarder::publish(const std::string& url, std::string_view when) {
    log(std::format("[SingleInstance] Emitting {} event ({}): {}", deep_link::kEventName, when, url));
    auto res = bus_.emit(std::string(deep_link::kEventName), url);
    if (!res) {
        std::println(stderr, "forwarder: emit failed ({}): {}", when, res.error());
    }
}

void SingleInstanceForwarder::raise_window() {
    if (auto res = window_.show(); !res) {
        std::println(stderr, "forwarder: failed to show main window: {}", res.error());
    }
    if (auto res = window_.focus(); !res) {
        std::println(stderr, "forwarder: failed to focus main window: {}", res.error());
    }
}

void SingleInstanceForwarder::log(const std::string& msg) {
    log_info(verbose_, msg);
}

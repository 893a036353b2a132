#include "config.hpp"
#include "instance_guard.hpp"
#include "log.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <filesystem>
#include <print>
#include <string>
#include <system_error>
#include <vector>

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;

    // argv[1] is reserved for a deep link; flags may follow it or replace it.
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: linkrelay [URL] [options]");
            std::println("Options:");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -h, --help          Show this help");
            return 0;
        }
    }

    std::vector<std::string> args(argv, argv + argc);

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);

    // Second launch: hand our arguments to the running instance and leave.
    UnixSocketClient guard_client;
    switch (claim_or_forward(guard_client, platform::ipc_endpoint(), args, ec ? "" : cwd.string())) {
        case InstanceRole::Forwarded:
            log_info(verbose, "Forwarded launch to running instance");
            return 0;
        case InstanceRole::ForwardFailed:
            return 1;
        case InstanceRole::Primary:
            break;
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);

    log_info(verbose, "Starting (scheme: " + config.deep_link.scheme + "://, window: " +
                          config.window.app_id + ")");

    LinuxEventLoop loop(std::move(config), std::move(args), verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize linkrelay");
        return 1;
    }

    loop.run();
    return 0;
}

#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <nlohmann/json.hpp>
#include <cstdio>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [args]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  ready              Signal UI readiness, print the pending link if any");
    std::println(stderr, "  listen             Subscribe and print deep-link events as they arrive");
    std::println(stderr, "  open URL [URL...]  Deliver an OS open-url activation (first URL wins)");
    std::println(stderr, "  toggle             Toggle main window visibility");
    std::println(stderr, "  status             Show coordinator status");
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];

    json cmd;
    if (command == "ready") {
        cmd = {{"cmd", "frontend_ready"}};
    } else if (command == "listen") {
        cmd = {{"cmd", "subscribe"}};
    } else if (command == "open") {
        if (argc < 3) {
            usage(argv[0]);
            return 1;
        }
        std::vector<std::string> urls(argv + 2, argv + argc);
        cmd = {{"cmd", "open_url"}, {"urls", urls}};
    } else if (command == "toggle") {
        cmd = {{"cmd", "toggle"}};
    } else if (command == "status") {
        cmd = {{"cmd", "status"}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to linkrelay at {}", sock_path);
        std::println(stderr, "Is linkrelay running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response) || !response.is_object()) {
        std::println(stderr, "No response from linkrelay (timeout)");
        return 1;
    }

    auto status = response.value("status", "");
    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "ready") {
        if (response.contains("url") && response["url"].is_string()) {
            std::println("{}", response["url"].get<std::string>());
        }
    } else if (command == "listen") {
        // Repeats of the same URL are re-deliveries, shown as sent.
        json event;
        while (client.recv(event, -1) && event.is_object()) {
            std::println("{} {}", event.value("event", ""), event.value("payload", ""));
            std::fflush(stdout);
        }
    } else if (command == "toggle") {
        std::println("Window: {}", response.value("window", "unknown"));
    } else if (command == "status") {
        std::println("Scheme: {}://", response.value("scheme", ""));
        std::println("Event: {}", response.value("event", ""));
        std::println("Shortcut: {}", response.value("shortcut", ""));
        std::println("Subscribers: {}", response.value("subscribers", 0));
    } else if (status == "ok") {
        std::println("OK");
    } else {
        std::println("{}", response.dump(2));
    }

    return 0;
}

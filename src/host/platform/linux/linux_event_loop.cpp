#include "platform/linux/linux_event_loop.hpp"

#include "log.hpp"
#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, std::vector<std::string> launch_args, bool verbose)
    : launch_args_(std::move(launch_args)), verbose_(verbose),
      event_bus_(ipc_server_, [this](int fd) { drop_client(fd); }),
      window_mgr_(config.window.app_id),
      core_(std::move(config), verbose_, event_bus_, scheduler_, window_mgr_) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool LinuxEventLoop::init() {
    if (!scheduler_.init()) return false;

    if (!window_mgr_.connect()) {
        std::println(stderr, "Window manager not available");
    }

    // Cold-start link and shortcut; a failed shortcut stops startup
    if (!core_.init(launch_args_, window_mgr_)) return false;

    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            std::println(stderr, "epoll_ctl({}) failed: {}", fd, std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_) || !add_fd(ipc_server_.server_fd()) || !add_fd(scheduler_.fd())) {
        return false;
    }
    if (window_mgr_.event_fd() >= 0 && !add_fd(window_mgr_.event_fd())) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
                    log(std::format("Received signal {}, shutting down", info.ssi_signo));
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
                        std::println(stderr, "epoll_ctl(client) failed: {}", std::strerror(errno));
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == scheduler_.fd()) {
                scheduler_.dispatch_due();
                continue;
            }

            if (fd == window_mgr_.event_fd()) {
                if (!window_mgr_.read_event()) {
                    std::println(stderr, "sway: event connection lost, shortcut disabled");
                    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
                }
                continue;
            }

            handle_client(fd);
        }
    }

    ipc_server_.stop();
}

void LinuxEventLoop::handle_client(int fd) {
    while (true) {
        nlohmann::json cmd;
        auto status = ipc_server_.read_command(fd, cmd);
        if (status == ReadStatus::Incomplete) return;
        if (status == ReadStatus::Closed) {
            drop_client(fd);
            return;
        }

        std::string cmd_str;
        if (cmd.is_object() && cmd.contains("cmd") && cmd["cmd"].is_string()) {
            cmd_str = cmd["cmd"].get<std::string>();
        }
        auto response = core_.handle_command(cmd_str, cmd);

        if (response.value("status", "") == "subscribed") {
            event_bus_.add_subscriber(fd);
            log(std::format("UI subscribed (fd {})", fd));
        } else if (cmd_str == "status") {
            response["subscribers"] = event_bus_.subscriber_count();
        }

        if (!ipc_server_.send_response(fd, response)) {
            drop_client(fd);
            return;
        }
    }
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    event_bus_.remove_subscriber(fd);
    ipc_server_.close_client(fd);
}

void LinuxEventLoop::log(const std::string& msg) {
    log_info(verbose_, msg);
}

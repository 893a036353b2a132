#pragma once

#include "activation_core.hpp"
#include "config.hpp"
#include "ipc_event_bus.hpp"
#include "platform/linux/sway_window_manager.hpp"
#include "platform/linux/timerfd_scheduler.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <atomic>
#include <string>
#include <vector>

class LinuxEventLoop {
public:
    LinuxEventLoop(Config config, std::vector<std::string> launch_args, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();

private:
    void handle_client(int fd);
    void drop_client(int fd);
    void log(const std::string& msg);

    std::vector<std::string> launch_args_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    UnixSocketServer ipc_server_;
    IpcEventBus event_bus_;
    TimerfdScheduler scheduler_;
    SwayWindowManager window_mgr_;

    // Portable activation logic
    ActivationCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;

    std::atomic<bool> running_{false};
};

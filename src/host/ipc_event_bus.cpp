#include "ipc_event_bus.hpp"

#include <algorithm>
#include <format>

IpcEventBus::IpcEventBus(IpcServer& ipc, SendFailedFn on_send_failed)
    : ipc_(ipc), on_send_failed_(std::move(on_send_failed)) {}

std::expected<void, std::string> IpcEventBus::emit(const std::string& event,
                                                   const std::string& payload) {
    nlohmann::json msg = {{"event", event}, {"payload", payload}};

    std::vector<int> failed;
    for (int fd : subscribers_) {
        if (!ipc_.send_response(fd, msg)) failed.push_back(fd);
    }
    if (failed.empty()) return {};

    std::string fds;
    for (int fd : failed) {
        remove_subscriber(fd);
        if (!fds.empty()) fds += ", ";
        fds += std::to_string(fd);
    }
    // Notify after the list is settled; the callback may re-enter the bus.
    if (on_send_failed_) {
        for (int fd : failed) on_send_failed_(fd);
    }
    return std::unexpected(std::format("send to subscriber fd {} failed, dropped", fds));
}

void IpcEventBus::add_subscriber(int fd) {
    if (std::ranges::find(subscribers_, fd) == subscribers_.end()) {
        subscribers_.push_back(fd);
    }
}

void IpcEventBus::remove_subscriber(int fd) {
    std::erase(subscribers_, fd);
}

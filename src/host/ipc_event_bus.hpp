#pragma once

#include "platform/event_bus.hpp"
#include "platform/ipc_server.hpp"

#include <cstddef>
#include <functional>
#include <vector>

// Publishes events as {"event": ..., "payload": ...} lines to every IPC
// client that sent "subscribe".
class IpcEventBus : public EventBus {
public:
    // Called with each subscriber whose send failed. The subscriber is
    // already removed; a short write may have left a partial line on its
    // stream, so the owner should close the connection.
    using SendFailedFn = std::function<void(int fd)>;

    explicit IpcEventBus(IpcServer& ipc, SendFailedFn on_send_failed = {});

    std::expected<void, std::string> emit(const std::string& event,
                                          const std::string& payload) override;

    void add_subscriber(int fd);
    void remove_subscriber(int fd);
    size_t subscriber_count() const { return subscribers_.size(); }

private:
    IpcServer& ipc_;
    SendFailedFn on_send_failed_;
    std::vector<int> subscribers_;
};

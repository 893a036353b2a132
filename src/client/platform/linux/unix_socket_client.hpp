#pragma once

#include "platform/ipc_client.hpp"

#include <string>

// IpcClient over an AF_UNIX stream socket. recv() polls, so the socket
// itself stays blocking.
class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient();
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send(const nlohmann::json& cmd) override;
    bool recv(nlohmann::json& response, int timeout_ms = 30000) override;
    void close() override;

private:
    int fd_ = -1;
    // Unconsumed bytes from earlier reads; may hold several lines or the
    // start of one. Cleared by close().
    std::string buf_;
};

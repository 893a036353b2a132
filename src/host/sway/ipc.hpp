#pragma once

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// One connection to sway's i3-ipc socket.
class SwayIpc {
public:
    static constexpr uint32_t MSG_RUN_COMMAND = 0;
    static constexpr uint32_t MSG_SUBSCRIBE = 2;
    static constexpr uint32_t MSG_GET_TREE = 4;
    static constexpr uint32_t EVENT_BINDING = 0x80000005;

    SwayIpc();
    ~SwayIpc();

    SwayIpc(const SwayIpc&) = delete;
    SwayIpc& operator=(const SwayIpc&) = delete;

    bool connect(const std::string& socket_path);
    void close();
    int fd() const { return fd_; }

    // Request/reply on this connection.
    std::expected<nlohmann::json, std::string> request(uint32_t type,
                                                       const std::string& payload = "");

    // Runs a command list; fails if any command reports success=false.
    std::expected<void, std::string> run_command(const std::string& command);

    // Reads one message (reply or event) from the socket.
    bool recv_message(uint32_t& type, std::string& payload);

private:
    static constexpr char MAGIC[] = "i3-ipc";

    bool send_message(uint32_t type, const std::string& payload);

    int fd_ = -1;
};

#include "sway/ipc.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

SwayIpc::SwayIpc() = default;

SwayIpc::~SwayIpc() {
    close();
}

bool SwayIpc::connect(const std::string& socket_path) {
    close();

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return false;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "sway: connect failed: {}", std::strerror(errno));
        close();
        return false;
    }
    return true;
}

void SwayIpc::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::expected<nlohmann::json, std::string> SwayIpc::request(uint32_t type,
                                                            const std::string& payload) {
    if (fd_ < 0) return std::unexpected("not connected to sway");
    if (!send_message(type, payload)) return std::unexpected("send to sway failed");

    uint32_t reply_type;
    std::string reply;
    if (!recv_message(reply_type, reply)) return std::unexpected("no reply from sway");
    if (reply_type != type) return std::unexpected("unexpected reply type from sway");

    try {
        return nlohmann::json::parse(reply);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string("bad reply from sway: ") + e.what());
    }
}

std::expected<void, std::string> SwayIpc::run_command(const std::string& command) {
    auto reply = request(MSG_RUN_COMMAND, command);
    if (!reply) return std::unexpected(reply.error());

    if (!reply->is_array()) return std::unexpected("'" + command + "': malformed reply");

    // One result object per command in the list.
    for (auto& result : *reply) {
        if (!result.is_object() || !result.value("success", false)) {
            return std::unexpected("'" + command + "': " +
                                   (result.is_object() ? result.value("error", "command failed")
                                                       : std::string("command failed")));
        }
    }
    return {};
}

bool SwayIpc::send_message(uint32_t type, const std::string& payload) {
    // Header: "i3-ipc" (6 bytes) + length (4 bytes) + type (4 bytes)
    uint32_t len = static_cast<uint32_t>(payload.size());
    char header[14];
    std::memcpy(header, MAGIC, 6);
    std::memcpy(header + 6, &len, 4);
    std::memcpy(header + 10, &type, 4);

    if (::send(fd_, header, 14, MSG_NOSIGNAL) != 14) return false;
    if (len > 0) {
        if (::send(fd_, payload.data(), len, MSG_NOSIGNAL) != static_cast<ssize_t>(len))
            return false;
    }
    return true;
}

bool SwayIpc::recv_message(uint32_t& type, std::string& payload) {
    if (fd_ < 0) return false;

    char header[14];
    size_t read_total = 0;
    while (read_total < 14) {
        ssize_t n = ::recv(fd_, header + read_total, 14 - read_total, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    if (std::memcmp(header, MAGIC, 6) != 0) return false;

    uint32_t len;
    std::memcpy(&len, header + 6, 4);
    std::memcpy(&type, header + 10, 4);

    payload.resize(len);
    read_total = 0;
    while (read_total < len) {
        ssize_t n = ::recv(fd_, payload.data() + read_total, len - read_total, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    return true;
}

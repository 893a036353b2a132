#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Line-oriented JSON connection to a running linkrelay instance. Each
// message is one JSON document terminated by '\n'. A single connection
// can carry one reply (commands) or an open-ended stream of events
// ("subscribe").
class IpcClient {
public:
    virtual ~IpcClient() = default;

    // Returns false if nothing is listening at `endpoint`. The single-
    // instance guard relies on this to decide it is the primary.
    virtual bool connect(const std::string& endpoint) = 0;

    // Writes `cmd` plus the terminating newline in one send.
    virtual bool send(const nlohmann::json& cmd) = 0;

    // Returns the next complete message. Bytes that arrive past it are
    // kept for the following call, so back-to-back events are not lost.
    // timeout_ms bounds the wait for more data; < 0 waits forever.
    // False on timeout, hang-up or a malformed line.
    virtual bool recv(nlohmann::json& response, int timeout_ms = 30000) = 0;

    // Drops the connection and any partially received message.
    virtual void close() = 0;
};

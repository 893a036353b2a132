#pragma once

#include "platform/ipc_client.hpp"

#include <string>
#include <vector>

enum class InstanceRole {
    Primary,        // nobody answered; this process should serve
    Forwarded,      // a running instance took our arguments
    ForwardFailed,  // a running instance answered but the hand-off broke
};

// Single-instance guard. Connects to `endpoint`; if an instance is
// listening there, hands it this launch's arguments and working directory.
InstanceRole claim_or_forward(IpcClient& client, const std::string& endpoint,
                              const std::vector<std::string>& args, const std::string& cwd,
                              int timeout_ms = 2000);

#include "instance_guard.hpp"

#include <print>

InstanceRole claim_or_forward(IpcClient& client, const std::string& endpoint,
                              const std::vector<std::string>& args, const std::string& cwd,
                              int timeout_ms) {
    if (!client.connect(endpoint)) return InstanceRole::Primary;

    nlohmann::json cmd = {{"cmd", "forward"}, {"args", args}, {"cwd", cwd}};
    if (!client.send(cmd)) {
        std::println(stderr, "instance: failed to forward arguments to running instance");
        client.close();
        return InstanceRole::ForwardFailed;
    }

    nlohmann::json response;
    bool acked = client.recv(response, timeout_ms) && response.is_object() &&
                 response.value("status", "") == "ok";
    client.close();
    if (!acked) {
        std::println(stderr, "instance: running instance did not acknowledge forward");
        return InstanceRole::ForwardFailed;
    }
    return InstanceRole::Forwarded;
}

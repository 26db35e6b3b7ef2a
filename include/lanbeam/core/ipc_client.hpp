#pragma once

#include "lanbeam/core/ipc_protocol.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace lanbeam::core {

class IPCClient {
public:
    // Return false to stop watching.
    using EventHandler = std::function<bool(const IPCEvent& event)>;

    explicit IPCClient(const std::string& socket_path = DEFAULT_IPC_SOCKET,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    // nullopt when the daemon is unreachable or the reply is malformed.
    std::optional<IPCResponse> send_request(const IPCRequest& request);
    bool is_daemon_running();

    // Blocks delivering daemon events until the handler returns false or
    // the connection drops. The returned response is the daemon's answer
    // to the watch request itself.
    std::optional<IPCResponse> watch(const EventHandler& handler);

private:
    int connect_to_daemon();

    std::string socket_path_;
    std::chrono::milliseconds timeout_;
};

}

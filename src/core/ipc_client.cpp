#include "lanbeam/core/ipc_client.hpp"
#include "lanbeam/core/logger.hpp"
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace lanbeam::core {

IPCClient::IPCClient(const std::string& socket_path, std::chrono::milliseconds timeout)
    : socket_path_(socket_path)
    , timeout_(timeout) {
}

int IPCClient::connect_to_daemon() {
    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        LOG_ERROR("IPC socket path too long: {}", socket_path_);
        return -1;
    }
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    int sock_fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (sock_fd < 0) {
        LOG_ERROR("Failed to create Unix socket: {}", std::strerror(errno));
        return -1;
    }

    if (::connect(sock_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_DEBUG("Failed to connect to daemon socket: {}", std::strerror(errno));
        ::close(sock_fd);
        return -1;
    }

    return sock_fd;
}

std::optional<IPCResponse> IPCClient::send_request(const IPCRequest& request) {
    int sock_fd = connect_to_daemon();
    if (sock_fd < 0) {
        return std::nullopt;
    }

    set_receive_timeout(sock_fd, timeout_);

    if (!write_all(sock_fd, format_request(request))) {
        LOG_ERROR("Failed to write to daemon socket: {}", std::strerror(errno));
        ::close(sock_fd);
        return std::nullopt;
    }

    LineReader reader(sock_fd);
    IPCResponse response;
    bool complete = read_response(reader, response);
    ::close(sock_fd);

    if (!complete) {
        LOG_ERROR("Failed to read response from daemon");
        return std::nullopt;
    }
    return response;
}

bool IPCClient::is_daemon_running() {
    IPCRequest request;
    request.command = "status";

    auto response = send_request(request);
    return response.has_value() && response->success;
}

std::optional<IPCResponse> IPCClient::watch(const EventHandler& handler) {
    int sock_fd = connect_to_daemon();
    if (sock_fd < 0) {
        return std::nullopt;
    }

    IPCRequest request;
    request.command = "watch";

    set_receive_timeout(sock_fd, timeout_);
    if (!write_all(sock_fd, format_request(request))) {
        ::close(sock_fd);
        return std::nullopt;
    }

    LineReader reader(sock_fd);
    IPCResponse response;
    if (!read_response(reader, response)) {
        ::close(sock_fd);
        return std::nullopt;
    }

    if (response.success) {
        // Events arrive whenever they happen; no receive timeout from here on.
        set_receive_timeout(sock_fd, std::chrono::milliseconds(0));

        IPCEvent event;
        while (read_event(reader, event)) {
            if (!handler(event)) {
                break;
            }
        }
    }

    ::close(sock_fd);
    return response;
}

}

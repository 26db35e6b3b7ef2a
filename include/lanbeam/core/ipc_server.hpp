#pragma once

#include "lanbeam/core/engine.hpp"
#include "lanbeam/core/ipc_protocol.hpp"
#include "lanbeam/core/result.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace lanbeam::core {

class IPCServer {
public:
    using ShutdownHandler = std::function<void()>;

    explicit IPCServer(Engine& engine, const std::string& socket_path = DEFAULT_IPC_SOCKET);
    ~IPCServer();

    IPCServer(const IPCServer&) = delete;
    IPCServer& operator=(const IPCServer&) = delete;

    Result start();
    void stop();
    bool is_running() const { return running_; }

    const std::string& socket_path() const { return socket_path_; }

    // Invoked by the `shutdown` command.
    void set_shutdown_handler(ShutdownHandler handler);

    IPCResponse handle_request(const IPCRequest& request);

private:
    struct ClientWorker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void handle_client(int client_fd);
    void stream_events(int client_fd);
    void reap_clients();

    IPCResponse handle_status_command(const IPCRequest& request);
    IPCResponse handle_users_command(const IPCRequest& request);
    IPCResponse handle_whoami_command(const IPCRequest& request);
    IPCResponse handle_interfaces_command(const IPCRequest& request);
    IPCResponse handle_settings_command(const IPCRequest& request);
    IPCResponse handle_send_command(const IPCRequest& request);
    IPCResponse handle_accept_command(const IPCRequest& request);
    IPCResponse handle_reject_command(const IPCRequest& request);
    IPCResponse handle_offers_command(const IPCRequest& request);
    IPCResponse handle_refresh_command(const IPCRequest& request);
    IPCResponse handle_shutdown_command(const IPCRequest& request);

    static IPCResponse from_result(const Result& result, const std::string& success_message);

    Engine& engine_;
    std::string socket_path_;
    int server_fd_;
    std::atomic<bool> running_;
    std::thread accept_thread_;

    std::mutex clients_mutex_;
    std::set<int> client_fds_;
    std::vector<ClientWorker> clients_;

    std::mutex handler_mutex_;
    ShutdownHandler shutdown_handler_;
};

}

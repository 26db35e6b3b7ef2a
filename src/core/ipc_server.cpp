#include "lanbeam/core/ipc_server.hpp"
#include "lanbeam/core/logger.hpp"
#include "lanbeam/core/utils.hpp"
#include <sys/socket.h>
#include <sys/un.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <iterator>
#include <optional>

namespace lanbeam::core {

namespace {

constexpr auto REQUEST_TIMEOUT = std::chrono::milliseconds(5000);
constexpr auto WATCH_POLL_INTERVAL = std::chrono::milliseconds(200);
constexpr std::size_t MAX_QUEUED_EVENTS = 1024;

std::optional<bool> parse_flag(const std::string& value) {
    auto lower = utils::StringUtils::to_lower(utils::StringUtils::trim(value));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

std::optional<std::string> parameter(const IPCRequest& request, const std::string& key) {
    auto it = request.parameters.find(key);
    if (it == request.parameters.end()) {
        return std::nullopt;
    }
    return it->second;
}

// True once the client has hung up.
bool client_gone(int fd) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLRDHUP;
    pfd.revents = 0;

    if (::poll(&pfd, 1, 0) <= 0) {
        return false;
    }
    if (pfd.revents & (POLLHUP | POLLRDHUP | POLLERR | POLLNVAL)) {
        return true;
    }

    // Anything sent after `watch` is ignored.
    char discard[256];
    return ::recv(fd, discard, sizeof(discard), MSG_DONTWAIT) == 0;
}

}

IPCServer::IPCServer(Engine& engine, const std::string& socket_path)
    : engine_(engine)
    , socket_path_(socket_path)
    , server_fd_(-1)
    , running_(false) {
}

IPCServer::~IPCServer() {
    stop();
}

Result IPCServer::start() {
    if (running_) {
        LOG_WARN("IPC server already running");
        return Result(ErrorCode::INVALID_STATE, "IPC server already running");
    }

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        return Result(ErrorCode::INVALID_ARGUMENT, "IPC socket path too long: " + socket_path_);
    }
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    // Remove a stale socket file left by a previous daemon
    ::unlink(socket_path_.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        LOG_ERROR("Failed to create Unix socket: {}", std::strerror(errno));
        return Result(ErrorCode::BIND_FAILED, std::string("socket: ") + std::strerror(errno));
    }

    if (::bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(server_fd_, 16) < 0) {
        int err = errno;
        LOG_ERROR("Failed to listen on Unix socket {}: {}", socket_path_, std::strerror(err));
        ::close(server_fd_);
        server_fd_ = -1;
        return Result(ErrorCode::BIND_FAILED, socket_path_ + ": " + std::strerror(err));
    }

    running_ = true;
    accept_thread_ = std::thread([this]() {
        accept_loop();
    });

    LOG_INFO("IPC server started on {}", socket_path_);
    return Result();
}

void IPCServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Stopping IPC server");

    // shutdown() wakes the blocked accept(); close() alone does not.
    ::shutdown(server_fd_, SHUT_RDWR);
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    ::close(server_fd_);
    server_fd_ = -1;

    std::vector<ClientWorker> clients;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (int fd : client_fds_) {
            ::shutdown(fd, SHUT_RDWR);
        }
        clients.swap(clients_);
    }
    for (auto& client : clients) {
        if (client.thread.joinable()) {
            client.thread.join();
        }
    }

    ::unlink(socket_path_.c_str());
}

void IPCServer::set_shutdown_handler(ShutdownHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    shutdown_handler_ = std::move(handler);
}

void IPCServer::accept_loop() {
    LOG_DEBUG("IPC server accept loop started");

    while (running_) {
        int client_fd = ::accept(server_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (running_) {
                LOG_ERROR("Failed to accept IPC connection: {}", std::strerror(errno));
            }
            break;
        }

        reap_clients();

        std::lock_guard<std::mutex> lock(clients_mutex_);
        if (!running_) {
            ::close(client_fd);
            break;
        }

        client_fds_.insert(client_fd);
        auto done = std::make_shared<std::atomic<bool>>(false);
        clients_.push_back(ClientWorker{
            std::thread([this, client_fd, done]() {
                handle_client(client_fd);
                {
                    std::lock_guard<std::mutex> guard(clients_mutex_);
                    client_fds_.erase(client_fd);
                    ::close(client_fd);
                }
                *done = true;
            }),
            done});
    }

    LOG_DEBUG("IPC server accept loop stopped");
}

void IPCServer::reap_clients() {
    std::vector<ClientWorker> finished;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        auto split = std::partition(clients_.begin(), clients_.end(),
                                    [](const ClientWorker& client) { return !*client.done; });
        std::move(split, clients_.end(), std::back_inserter(finished));
        clients_.erase(split, clients_.end());
    }
    for (auto& client : finished) {
        client.thread.join();
    }
}

void IPCServer::handle_client(int client_fd) {
    set_receive_timeout(client_fd, REQUEST_TIMEOUT);

    LineReader reader(client_fd);
    IPCRequest request;
    if (!read_request(reader, request)) {
        LOG_DEBUG("IPC client closed before sending a complete request");
        return;
    }

    LOG_DEBUG("IPC request: {}", request.command);

    if (request.command == "watch") {
        stream_events(client_fd);
        return;
    }

    IPCResponse response;
    try {
        response = handle_request(request);
    } catch (const std::exception& e) {
        LOG_ERROR("Error handling IPC command {}: {}", request.command, e.what());
        response = IPCResponse::error("Internal error: " + std::string(e.what()));
        response.data["error"] = to_string(ErrorCode::INTERNAL_ERROR);
    }

    if (!write_all(client_fd, format_response(response))) {
        LOG_DEBUG("IPC client went away before the response was written");
    }
}

void IPCServer::stream_events(int client_fd) {
    // Shared with the subscription: publish() may still be running the
    // handler on another thread after unsubscribe() returns.
    struct WatchQueue {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::string> events;
        bool overflowed = false;
    };
    auto queue = std::make_shared<WatchQueue>();

    auto subscription = engine_.events().subscribe([queue](const Event& event) {
        auto text = format_event(event);
        {
            std::lock_guard<std::mutex> lock(queue->mutex);
            if (queue->events.size() >= MAX_QUEUED_EVENTS) {
                queue->events.pop_front();
                queue->overflowed = true;
            }
            queue->events.push_back(std::move(text));
        }
        queue->cv.notify_one();
    });

    bool connected = write_all(client_fd, format_response(IPCResponse::ok("Watching events")));
    if (connected) {
        LOG_DEBUG("IPC watcher attached");
    }

    while (connected && running_) {
        std::deque<std::string> pending;
        bool dropped = false;
        {
            std::unique_lock<std::mutex> lock(queue->mutex);
            queue->cv.wait_for(lock, WATCH_POLL_INTERVAL, [&]() { return !queue->events.empty(); });
            pending.swap(queue->events);
            std::swap(dropped, queue->overflowed);
        }

        if (dropped) {
            LOG_WARN("IPC watcher is too slow; dropped events");
        }

        for (const auto& text : pending) {
            if (!write_all(client_fd, text)) {
                connected = false;
                break;
            }
        }

        if (connected && pending.empty() && client_gone(client_fd)) {
            connected = false;
        }
    }

    engine_.events().unsubscribe(subscription);
    LOG_DEBUG("IPC watcher detached");
}

IPCResponse IPCServer::handle_request(const IPCRequest& request) {
    if (request.command == "status") {
        return handle_status_command(request);
    } else if (request.command == "users") {
        return handle_users_command(request);
    } else if (request.command == "whoami") {
        return handle_whoami_command(request);
    } else if (request.command == "interfaces") {
        return handle_interfaces_command(request);
    } else if (request.command == "settings") {
        return handle_settings_command(request);
    } else if (request.command == "send") {
        return handle_send_command(request);
    } else if (request.command == "accept") {
        return handle_accept_command(request);
    } else if (request.command == "reject") {
        return handle_reject_command(request);
    } else if (request.command == "offers") {
        return handle_offers_command(request);
    } else if (request.command == "refresh") {
        return handle_refresh_command(request);
    } else if (request.command == "shutdown") {
        return handle_shutdown_command(request);
    }

    auto response = IPCResponse::error("Unknown command: " + request.command);
    response.data["error"] = to_string(ErrorCode::INVALID_ARGUMENT);
    return response;
}

IPCResponse IPCServer::from_result(const Result& result, const std::string& success_message) {
    if (result) {
        return IPCResponse::ok(success_message);
    }

    auto response = IPCResponse::error(result.message.empty() ? to_string(result.error) : result.message);
    response.data["error"] = to_string(result.error);
    return response;
}

IPCResponse IPCServer::handle_status_command(const IPCRequest&) {
    auto response = IPCResponse::ok("Status retrieved successfully");
    response.data["daemon_running"] = engine_.is_running() ? "true" : "false";
    response.data["offer_port"] = std::to_string(engine_.offer_port());
    response.data["discovery_port"] = std::to_string(engine_.discovery_port());
    response.data["peer_count"] = std::to_string(engine_.registry().size());
    response.data["offer_count"] = std::to_string(engine_.list_offers().size());
    response.data["download_dir"] = engine_.options().download_directory.string();
    return response;
}

IPCResponse IPCServer::handle_users_command(const IPCRequest&) {
    auto peers = engine_.get_users();

    auto response = IPCResponse::ok("Users retrieved successfully");
    response.data["peer.count"] = std::to_string(peers.size());
    for (std::size_t i = 0; i < peers.size(); ++i) {
        auto prefix = "peer." + std::to_string(i) + ".";
        response.data[prefix + "address"] = peers[i].address;
        response.data[prefix + "username"] = peers[i].username;
    }
    return response;
}

IPCResponse IPCServer::handle_whoami_command(const IPCRequest&) {
    auto response = IPCResponse::ok("Own address retrieved successfully");
    response.data["address"] = engine_.get_own_address();
    response.data["username"] = engine_.get_settings().username;
    return response;
}

IPCResponse IPCServer::handle_interfaces_command(const IPCRequest&) {
    auto interfaces = engine_.get_network_interfaces();

    auto response = IPCResponse::ok("Interfaces retrieved successfully");
    response.data["interface.count"] = std::to_string(interfaces.size());
    for (std::size_t i = 0; i < interfaces.size(); ++i) {
        auto prefix = "interface." + std::to_string(i) + ".";
        response.data[prefix + "name"] = interfaces[i].name;
        response.data[prefix + "ip"] = interfaces[i].ip;
        response.data[prefix + "broadcast"] = interfaces[i].broadcast;
    }
    return response;
}

IPCResponse IPCServer::handle_settings_command(const IPCRequest& request) {
    auto settings = engine_.get_settings();
    std::string message = "Settings retrieved successfully";

    if (!request.parameters.empty()) {
        if (auto username = parameter(request, "username")) {
            settings.username = *username;
        }
        if (auto broadcasting = parameter(request, "broadcasting_enabled")) {
            auto flag = parse_flag(*broadcasting);
            if (!flag) {
                return from_result(Result(ErrorCode::INVALID_ARGUMENT,
                                          "broadcasting_enabled must be true or false"), "");
            }
            settings.broadcasting_enabled = *flag;
        }
        if (auto address = parameter(request, "broadcast_address")) {
            settings.broadcast_address = *address;
        }

        auto result = engine_.update_settings(settings);
        if (!result) {
            return from_result(result, "");
        }
        settings = engine_.get_settings();
        message = "Settings updated";
    }

    auto response = IPCResponse::ok(message);
    response.data["username"] = settings.username;
    response.data["broadcasting_enabled"] = settings.broadcasting_enabled ? "true" : "false";
    response.data["broadcast_address"] = settings.broadcast_address;
    return response;
}

IPCResponse IPCServer::handle_send_command(const IPCRequest& request) {
    auto address = parameter(request, "address");
    if (!address || address->empty()) {
        return from_result(Result(ErrorCode::INVALID_ARGUMENT, "Missing parameter: address"), "");
    }

    std::vector<std::string> paths;
    auto count = parameter(request, "file.count");
    if (count) {
        std::size_t n = 0;
        try {
            n = std::stoul(*count);
        } catch (const std::exception&) {
            return from_result(Result(ErrorCode::INVALID_ARGUMENT, "Invalid file.count: " + *count), "");
        }
        for (std::size_t i = 0; i < n; ++i) {
            auto path = parameter(request, "file." + std::to_string(i));
            if (!path) {
                return from_result(Result(ErrorCode::INVALID_ARGUMENT,
                                          "Missing parameter: file." + std::to_string(i)), "");
            }
            paths.push_back(*path);
        }
    }

    std::string offer_id;
    auto result = engine_.send_files(*address, paths, offer_id);
    auto response = from_result(result, "Offer sent");
    if (result) {
        response.data["offer_id"] = offer_id;
    }
    return response;
}

IPCResponse IPCServer::handle_accept_command(const IPCRequest& request) {
    auto offer_id = parameter(request, "offer_id");
    if (!offer_id) {
        return from_result(Result(ErrorCode::INVALID_ARGUMENT, "Missing parameter: offer_id"), "");
    }
    return from_result(engine_.accept_file_offer(*offer_id), "Offer accepted");
}

IPCResponse IPCServer::handle_reject_command(const IPCRequest& request) {
    auto offer_id = parameter(request, "offer_id");
    if (!offer_id) {
        return from_result(Result(ErrorCode::INVALID_ARGUMENT, "Missing parameter: offer_id"), "");
    }
    return from_result(engine_.reject_file_offer(*offer_id), "Offer rejected");
}

IPCResponse IPCServer::handle_offers_command(const IPCRequest&) {
    auto offers = engine_.list_offers();

    auto response = IPCResponse::ok("Offers retrieved successfully");
    response.data["offer.count"] = std::to_string(offers.size());
    for (std::size_t i = 0; i < offers.size(); ++i) {
        const auto& offer = offers[i];
        auto prefix = "offer." + std::to_string(i) + ".";
        response.data[prefix + "id"] = offer.id;
        response.data[prefix + "direction"] = transfer::to_string(offer.direction);
        response.data[prefix + "peer"] = offer.peer;
        response.data[prefix + "sender_name"] = offer.sender_name;
        response.data[prefix + "status"] = transfer::to_string(offer.status);
        response.data[prefix + "total_size"] = std::to_string(offer.total_size);
        response.data[prefix + "file.count"] = std::to_string(offer.files.size());
        for (std::size_t j = 0; j < offer.files.size(); ++j) {
            auto file_prefix = prefix + "file." + std::to_string(j) + ".";
            response.data[file_prefix + "name"] = offer.files[j].name;
            response.data[file_prefix + "size"] = std::to_string(offer.files[j].size);
        }
    }
    return response;
}

IPCResponse IPCServer::handle_refresh_command(const IPCRequest&) {
    engine_.refresh_peers();
    return IPCResponse::ok("Peer query sent");
}

IPCResponse IPCServer::handle_shutdown_command(const IPCRequest&) {
    ShutdownHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = shutdown_handler_;
    }

    if (!handler) {
        return from_result(Result(ErrorCode::INVALID_STATE, "Shutdown is not supported by this daemon"), "");
    }

    handler();
    return IPCResponse::ok("Daemon shutting down");
}

}

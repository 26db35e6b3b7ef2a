#pragma once

#include "lanbeam/core/result.hpp"
#include <utility>  // boost 1.74 asio/awaitable.hpp needs std::exchange
#include <boost/asio.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace lanbeam::network {

using boost::asio::ip::tcp;

// Accepts inbound offer connections and hands each socket to the accept
// handler on the server thread. The handler must return quickly.
class TcpServer {
public:
    using AcceptHandler = std::function<void(tcp::socket socket)>;

    // Port 0 picks an ephemeral port; see local_port().
    explicit TcpServer(std::uint16_t port);
    ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    core::Result start();
    void stop();

    bool is_running() const { return running_; }
    std::uint16_t local_port() const { return local_port_; }

    void set_accept_handler(AcceptHandler handler);

private:
    void do_accept();

    std::uint16_t port_;
    std::atomic<std::uint16_t> local_port_;
    std::atomic<bool> running_;

    boost::asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::thread server_thread_;

    std::mutex handler_mutex_;
    AcceptHandler accept_handler_;
};

}

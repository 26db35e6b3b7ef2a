#include "lanbeam/network/tcp_server.hpp"
#include "lanbeam/core/logger.hpp"

namespace lanbeam::network {

TcpServer::TcpServer(std::uint16_t port)
    : port_(port)
    , local_port_(0)
    , running_(false)
    , io_context_()
    , acceptor_(io_context_) {
}

TcpServer::~TcpServer() {
    stop();
}

core::Result TcpServer::start() {
    if (running_) {
        LOG_WARN("TCP server already running");
        return core::Result(core::ErrorCode::INVALID_STATE, "TCP server already running");
    }

    boost::system::error_code ec;
    tcp::endpoint endpoint(tcp::v4(), port_);

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);

    if (ec) {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        LOG_ERROR("Failed to start TCP server on port {}: {}", port_, ec.message());
        return core::Result(core::ErrorCode::BIND_FAILED,
                            "TCP port " + std::to_string(port_) + ": " + ec.message());
    }

    local_port_ = acceptor_.local_endpoint(ec).port();
    running_ = true;
    io_context_.restart();

    do_accept();

    server_thread_ = std::thread([this]() {
        LOG_INFO("TCP server started on port {}", local_port_.load());

        while (running_) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("IO context error: {}", e.what());
                if (!running_) break;

                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                io_context_.restart();
            }
        }

        LOG_INFO("TCP server stopped");
    });

    return core::Result();
}

void TcpServer::stop() {
    if (!running_) {
        return;
    }

    LOG_INFO("Stopping TCP server on port {}", local_port_.load());
    running_ = false;

    boost::asio::post(io_context_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    boost::system::error_code ec;
    acceptor_.close(ec);
}

void TcpServer::set_accept_handler(AcceptHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    accept_handler_ = std::move(handler);
}

void TcpServer::do_accept() {
    if (!running_) {
        return;
    }

    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!ec && running_) {
                boost::system::error_code endpoint_ec;
                auto remote = socket.remote_endpoint(endpoint_ec);
                LOG_DEBUG("Accepted connection from {}",
                          endpoint_ec ? std::string("unknown") : remote.address().to_string());

                AcceptHandler handler;
                {
                    std::lock_guard<std::mutex> lock(handler_mutex_);
                    handler = accept_handler_;
                }

                if (handler) {
                    try {
                        handler(std::move(socket));
                    } catch (const std::exception& e) {
                        LOG_ERROR("Accept handler failed: {}", e.what());
                    }
                } else {
                    LOG_WARN("No accept handler installed; dropping connection");
                }

                do_accept();
            } else if (ec != boost::asio::error::operation_aborted) {
                LOG_ERROR("Accept error: {}", ec.message());

                if (running_) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                    do_accept();
                }
            }
        });
}

}

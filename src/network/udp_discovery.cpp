#include "lanbeam/network/udp_discovery.hpp"
#include "lanbeam/network/interfaces.hpp"
#include "lanbeam/crypto/random.hpp"
#include "lanbeam/core/logger.hpp"

namespace lanbeam::network {

UdpDiscovery::UdpDiscovery(PeerRegistry& registry, const core::SettingsStore& settings,
                           DiscoveryOptions options)
    : registry_(registry)
    , settings_(settings)
    , options_(options)
    , instance_id_(crypto::SecureRandom::generate_uint64())
    , offer_port_(0)
    , local_port_(0)
    , running_(false)
    , bound_(false)
    , io_context_()
    , socket_(io_context_)
    , bind_failure_logged_(false)
    , send_failure_logged_(false)
    , tick_requested_(false) {
}

UdpDiscovery::~UdpDiscovery() {
    stop();
}

core::Result UdpDiscovery::start() {
    if (running_) {
        LOG_WARN("UDP discovery already running");
        return core::Result(core::ErrorCode::INVALID_STATE, "UDP discovery already running");
    }

    running_ = true;
    io_context_.restart();
    work_guard_.emplace(boost::asio::make_work_guard(io_context_));

    // First bind happens before the io thread exists so callers can read
    // local_port() right after start().
    if (ensure_bound()) {
        do_receive();
    }

    io_thread_ = std::thread([this]() {
        LOG_DEBUG("UDP discovery IO thread started");
        while (running_) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("UDP discovery IO error: {}", e.what());
                if (!running_) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                io_context_.restart();
            }
        }
        LOG_DEBUG("UDP discovery IO thread stopped");
    });

    discovery_thread_ = std::thread([this]() {
        discovery_loop();
    });

    LOG_INFO("UDP discovery started (listen port {}, announce port {}, instance {:016x})",
             local_port_.load(), announce_port(), instance_id_);
    return core::Result();
}

void UdpDiscovery::stop() {
    if (!running_) {
        return;
    }

    LOG_INFO("Stopping UDP discovery");
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        running_ = false;
    }
    loop_cv_.notify_all();

    if (discovery_thread_.joinable()) {
        discovery_thread_.join();
    }

    boost::asio::post(io_context_, [this]() {
        boost::system::error_code ec;
        socket_.close(ec);
        bound_ = false;
    });
    work_guard_.reset();

    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    io_context_.stop();

    boost::system::error_code ec;
    socket_.close(ec);
    bound_ = false;
}

void UdpDiscovery::announce_now() {
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        tick_requested_ = true;
    }
    loop_cv_.notify_all();
}

void UdpDiscovery::query_peers() {
    if (!running_) {
        return;
    }

    PeerQueryMessage query{instance_id_};
    auto datagram = std::make_shared<std::vector<std::uint8_t>>(
        frame_message(MessageType::PEER_QUERY, query));
    auto targets = announce_targets(settings_.get());
    auto port = announce_port();

    boost::asio::post(io_context_, [this, datagram, targets, port]() {
        if (ensure_bound()) {
            send_datagram(datagram, targets, port);
        }
    });
}

void UdpDiscovery::discovery_loop() {
    LOG_DEBUG("UDP discovery loop started");

    std::unique_lock<std::mutex> lock(loop_mutex_);
    while (running_) {
        tick_requested_ = false;
        lock.unlock();
        tick();
        lock.lock();

        loop_cv_.wait_for(lock, options_.announce_interval, [this]() {
            return !running_ || tick_requested_;
        });
    }

    LOG_DEBUG("UDP discovery loop stopped");
}

void UdpDiscovery::tick() {
    registry_.remove_expired();

    auto settings = settings_.get();

    bool rebind = !bound_;
    if (!settings.broadcasting_enabled) {
        if (rebind) {
            boost::asio::post(io_context_, [this]() {
                if (!bound_ && ensure_bound()) {
                    do_receive();
                }
            });
        }
        return;
    }

    auto datagram = std::make_shared<std::vector<std::uint8_t>>(
        frame_message(MessageType::PEER_ANNOUNCE, make_presence(settings)));
    auto targets = announce_targets(settings);
    auto port = announce_port();

    boost::asio::post(io_context_, [this, datagram, targets, port]() {
        bool was_bound = bound_;
        if (!ensure_bound()) {
            return;
        }
        if (!was_bound) {
            do_receive();
        }
        send_datagram(datagram, targets, port);
    });
}

bool UdpDiscovery::ensure_bound() {
    if (bound_) {
        return true;
    }

    boost::system::error_code ec;
    if (socket_.is_open()) {
        socket_.close(ec);
    }

    socket_.open(udp::v4(), ec);
    if (!ec) socket_.set_option(udp::socket::reuse_address(true), ec);
    if (!ec) socket_.set_option(boost::asio::socket_base::broadcast(true), ec);
    if (!ec) socket_.bind(udp::endpoint(udp::v4(), options_.listen_port), ec);

    if (ec) {
        if (!bind_failure_logged_) {
            LOG_ERROR("Discovery bind on UDP port {} failed ({}): {}; retrying every tick",
                      options_.listen_port, core::to_string(core::ErrorCode::BIND_FAILED),
                      ec.message());
            bind_failure_logged_ = true;
        } else {
            LOG_DEBUG("Discovery bind retry failed: {}", ec.message());
        }
        boost::system::error_code ignored;
        socket_.close(ignored);
        return false;
    }

    local_port_ = socket_.local_endpoint(ec).port();
    bound_ = true;
    if (bind_failure_logged_) {
        LOG_INFO("Discovery bound to UDP port {}", local_port_.load());
        bind_failure_logged_ = false;
    }
    return true;
}

void UdpDiscovery::do_receive() {
    if (!running_ || !bound_) {
        return;
    }

    socket_.async_receive_from(
        boost::asio::buffer(receive_buffer_), sender_endpoint_,
        [this](boost::system::error_code ec, std::size_t bytes_received) {
            if (!ec && running_) {
                handle_datagram(sender_endpoint_,
                                std::span<const std::uint8_t>(receive_buffer_.data(), bytes_received));
                do_receive();
            } else if (ec != boost::asio::error::operation_aborted) {
                LOG_ERROR("UDP receive error: {}", ec.message());
                if (running_) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                    do_receive();
                }
            }
        });
}

void UdpDiscovery::handle_datagram(const udp::endpoint& sender, std::span<const std::uint8_t> data) {
    try {
        auto frame = deserialize_frame(data);

        switch (frame.header.type) {
            case MessageType::PEER_ANNOUNCE:
            case MessageType::PEER_RESPONSE:
                handle_presence(sender, PresenceMessage::deserialize(frame.payload));
                break;
            case MessageType::PEER_QUERY:
                handle_query(sender, PeerQueryMessage::deserialize(frame.payload));
                break;
            default:
                LOG_DEBUG("Ignoring discovery message {} from {}",
                          to_string(frame.header.type), sender.address().to_string());
                break;
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("Dropping malformed datagram from {}: {}", sender.address().to_string(), e.what());
    }
}

void UdpDiscovery::handle_presence(const udp::endpoint& sender, const PresenceMessage& msg) {
    if (msg.instance_id == instance_id_) {
        return;
    }
    if (msg.offer_port == 0 || msg.username.empty()) {
        LOG_DEBUG("Ignoring incomplete presence from {}", sender.address().to_string());
        return;
    }

    Endpoint endpoint{sender.address().to_v4().to_string(), msg.offer_port};
    registry_.upsert(endpoint.to_string(), msg.username);
}

void UdpDiscovery::handle_query(const udp::endpoint& sender, const PeerQueryMessage& msg) {
    if (msg.instance_id == instance_id_) {
        return;
    }

    auto settings = settings_.get();
    if (!settings.broadcasting_enabled) {
        return;
    }

    auto datagram = std::make_shared<std::vector<std::uint8_t>>(
        frame_message(MessageType::PEER_RESPONSE, make_presence(settings)));

    socket_.async_send_to(
        boost::asio::buffer(*datagram), sender,
        [datagram, sender](boost::system::error_code ec, std::size_t) {
            if (ec) {
                LOG_WARN("Failed to send peer response to {}: {}",
                         sender.address().to_string(), ec.message());
            }
        });
}

void UdpDiscovery::send_datagram(std::shared_ptr<std::vector<std::uint8_t>> datagram,
                                 const std::vector<std::string>& addresses, std::uint16_t port) {
    for (const auto& address : addresses) {
        boost::system::error_code ec;
        auto target_address = boost::asio::ip::make_address_v4(address, ec);
        if (ec) {
            LOG_WARN("Skipping invalid broadcast address '{}'", address);
            continue;
        }

        udp::endpoint target(target_address, port);
        socket_.async_send_to(
            boost::asio::buffer(*datagram), target,
            [this, datagram, address](boost::system::error_code ec, std::size_t bytes_sent) {
                if (ec) {
                    if (!send_failure_logged_) {
                        LOG_WARN("Announcement to {} failed ({}): {}", address,
                                 core::to_string(core::ErrorCode::BROADCAST_FAILED), ec.message());
                        send_failure_logged_ = true;
                    } else {
                        LOG_DEBUG("Announcement to {} failed: {}", address, ec.message());
                    }
                } else {
                    send_failure_logged_ = false;
                    LOG_TRACE("Sent presence to {} ({} bytes)", address, bytes_sent);
                }
            });
    }
}

PresenceMessage UdpDiscovery::make_presence(const core::Settings& settings) const {
    return PresenceMessage{instance_id_, settings.username, offer_port_.load()};
}

std::vector<std::string> UdpDiscovery::announce_targets(const core::Settings& settings) const {
    if (settings.broadcast_address == ALL_INTERFACES_BROADCAST) {
        return interface_broadcast_addresses();
    }
    return {settings.broadcast_address};
}

std::uint16_t UdpDiscovery::announce_port() const {
    if (options_.announce_port != 0) {
        return options_.announce_port;
    }
    if (options_.listen_port != 0) {
        return options_.listen_port;
    }
    return local_port_;
}

}

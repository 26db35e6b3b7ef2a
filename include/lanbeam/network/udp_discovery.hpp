#pragma once

#include "lanbeam/core/result.hpp"
#include "lanbeam/core/settings_store.hpp"
#include "lanbeam/network/peer_registry.hpp"
#include "lanbeam/network/protocol.hpp"
#include <utility>  // boost 1.74 asio/awaitable.hpp needs std::exchange
#include <boost/asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lanbeam::network {

using boost::asio::ip::udp;

struct DiscoveryOptions {
    // UDP port the listener binds; 0 picks an ephemeral port.
    std::uint16_t listen_port = 53317;

    // Destination port of presence datagrams; 0 means listen_port.
    std::uint16_t announce_port = 0;

    std::chrono::milliseconds announce_interval{1000};
};

class UdpDiscovery {
public:
    UdpDiscovery(PeerRegistry& registry, const core::SettingsStore& settings,
                 DiscoveryOptions options);
    ~UdpDiscovery();

    UdpDiscovery(const UdpDiscovery&) = delete;
    UdpDiscovery& operator=(const UdpDiscovery&) = delete;

    // TCP port advertised to peers for offers.
    void set_offer_port(std::uint16_t port) { offer_port_ = port; }

    core::Result start();
    void stop();

    // Runs a tick immediately instead of waiting for the interval.
    void announce_now();

    // Asks listeners with broadcasting enabled to reply with their presence.
    void query_peers();

    bool is_running() const { return running_; }
    bool is_bound() const { return bound_; }
    std::uint16_t local_port() const { return local_port_; }
    std::uint64_t instance_id() const { return instance_id_; }

private:
    void discovery_loop();
    void tick();

    // io thread only
    bool ensure_bound();
    void do_receive();
    void handle_datagram(const udp::endpoint& sender, std::span<const std::uint8_t> data);
    void handle_presence(const udp::endpoint& sender, const PresenceMessage& msg);
    void handle_query(const udp::endpoint& sender, const PeerQueryMessage& msg);
    void send_datagram(std::shared_ptr<std::vector<std::uint8_t>> datagram,
                       const std::vector<std::string>& addresses, std::uint16_t port);

    PresenceMessage make_presence(const core::Settings& settings) const;
    std::vector<std::string> announce_targets(const core::Settings& settings) const;
    std::uint16_t announce_port() const;

    PeerRegistry& registry_;
    const core::SettingsStore& settings_;
    const DiscoveryOptions options_;
    const std::uint64_t instance_id_;

    std::atomic<std::uint16_t> offer_port_;
    std::atomic<std::uint16_t> local_port_;
    std::atomic<bool> running_;
    std::atomic<bool> bound_;

    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    udp::socket socket_;
    udp::endpoint sender_endpoint_;
    std::array<std::uint8_t, 65536> receive_buffer_;
    bool bind_failure_logged_;
    bool send_failure_logged_;

    std::thread io_thread_;
    std::thread discovery_thread_;

    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    bool tick_requested_;
};

}

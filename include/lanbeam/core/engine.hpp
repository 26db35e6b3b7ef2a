#pragma once

#include "lanbeam/core/config.hpp"
#include "lanbeam/core/event_bus.hpp"
#include "lanbeam/core/result.hpp"
#include "lanbeam/core/settings_store.hpp"
#include "lanbeam/network/interfaces.hpp"
#include "lanbeam/network/peer_registry.hpp"
#include "lanbeam/network/tcp_server.hpp"
#include "lanbeam/network/udp_discovery.hpp"
#include "lanbeam/transfer/offer_negotiator.hpp"
#include "lanbeam/transfer/transfer_engine.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lanbeam::core {

struct EngineOptions {
    network::DiscoveryOptions discovery;
    std::chrono::milliseconds peer_expiry{3000};

    // TCP offer port; 0 picks an ephemeral port.
    std::uint16_t transfer_port = 53318;

    transfer::NegotiatorOptions negotiation;
    transfer::TransferOptions transfer;

    std::filesystem::path download_directory;
    std::filesystem::path settings_file;

    static EngineOptions from_config(const Config& config);
};

// One LAN node: discovery, offer negotiation and transfers behind the
// command surface used by the IPC server.
class Engine {
public:
    explicit Engine(EngineOptions options);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Loads settings and starts the offer listener and discovery. Only the
    // offer listener is required; discovery keeps retrying its bind.
    Result start();
    void stop();
    bool is_running() const { return running_; }

    std::vector<network::Peer> get_users() const;

    // "ip:offer_port" of this node.
    std::string get_own_address() const;

    std::vector<network::NetworkInterfaceInfo> get_network_interfaces() const;

    Settings get_settings() const;
    Result update_settings(const Settings& settings);

    Result send_files(const std::string& recipient, const std::vector<std::string>& paths,
                      std::string& offer_id);
    Result accept_file_offer(const std::string& offer_id);
    Result reject_file_offer(const std::string& offer_id);
    std::vector<transfer::FileOffer> list_offers() const;

    // Announces immediately and asks other nodes to reply.
    void refresh_peers();

    EventBus& events() { return events_; }
    network::PeerRegistry& registry() { return registry_; }

    std::uint16_t offer_port() const;
    std::uint16_t discovery_port() const;
    const EngineOptions& options() const { return options_; }

private:
    EngineOptions options_;

    EventBus events_;
    SettingsStore settings_;
    network::PeerRegistry registry_;
    transfer::TransferEngine transfer_engine_;
    transfer::OfferNegotiator negotiator_;
    network::TcpServer tcp_server_;
    network::UdpDiscovery discovery_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_;
    bool stopped_;
};

}

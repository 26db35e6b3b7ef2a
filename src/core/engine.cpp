#include "lanbeam/core/engine.hpp"
#include "lanbeam/core/logger.hpp"
#include "lanbeam/core/utils.hpp"

namespace lanbeam::core {

EngineOptions EngineOptions::from_config(const Config& config) {
    EngineOptions options;

    options.discovery.listen_port = static_cast<std::uint16_t>(config.get_int("discovery.port", 53317));
    options.discovery.announce_port = static_cast<std::uint16_t>(config.get_int("discovery.announce_port", 0));
    options.discovery.announce_interval = config.get_millis("discovery.announce_interval_ms",
                                                            options.discovery.announce_interval);
    options.peer_expiry = config.get_millis("discovery.peer_expiry_ms", options.peer_expiry);

    options.transfer_port = static_cast<std::uint16_t>(config.get_int("transfer.port", 53318));
    options.transfer.chunk_size = static_cast<std::size_t>(
        config.get_int("transfer.chunk_size", static_cast<int>(options.transfer.chunk_size)));
    options.transfer.stall_timeout = config.get_millis("transfer.stall_timeout_ms", options.transfer.stall_timeout);
    options.transfer.progress_interval = config.get_millis("transfer.progress_interval_ms",
                                                           options.transfer.progress_interval);

    options.negotiation.proposal_timeout = config.get_millis("offer.proposal_timeout_ms",
                                                             options.negotiation.proposal_timeout);
    options.negotiation.connect_timeout = config.get_millis("offer.connect_timeout_ms",
                                                            options.negotiation.connect_timeout);
    options.negotiation.handshake_timeout = config.get_millis("offer.handshake_timeout_ms",
                                                              options.negotiation.handshake_timeout);

    options.download_directory = utils::FileUtils::expand_user(
        config.get_string("storage.download_dir", "~/Downloads"));
    options.settings_file = utils::FileUtils::expand_user(
        config.get_string("storage.settings_file", "~/.lanbeam/settings.conf"));

    return options;
}

Engine::Engine(EngineOptions options)
    : options_(std::move(options))
    , events_()
    , settings_(options_.settings_file)
    , registry_(options_.peer_expiry)
    , transfer_engine_(events_, storage::StorageConfig(options_.download_directory), options_.transfer)
    , negotiator_(registry_, transfer_engine_, events_, settings_, options_.negotiation)
    , tcp_server_(options_.transfer_port)
    , discovery_(registry_, settings_, options_.discovery)
    , running_(false)
    , stopped_(false) {

    registry_.set_change_handler(
        [this](network::PeerChange change, const network::Peer& peer, const std::vector<network::Peer>& peers) {
            events_.publish(PeersUpdatedEvent{change, peer, peers});
        });

    tcp_server_.set_accept_handler([this](network::tcp::socket socket) {
        negotiator_.handle_connection(std::move(socket));
    });
}

Engine::~Engine() {
    stop();
}

Result Engine::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_ || stopped_) {
        return Result(ErrorCode::INVALID_STATE, "Engine can only be started once");
    }

    if (auto loaded = settings_.load(); !loaded) {
        LOG_WARN("Using default settings: {}", loaded.describe());
    }

    auto listening = tcp_server_.start();
    if (!listening) {
        return listening;
    }

    negotiator_.set_local_port(tcp_server_.local_port());
    discovery_.set_offer_port(tcp_server_.local_port());

    if (auto discovering = discovery_.start(); !discovering) {
        LOG_WARN("Discovery did not start: {}", discovering.describe());
    }

    running_ = true;
    LOG_INFO("Engine started: offers on TCP {}, discovery on UDP {}, downloads to {}",
             tcp_server_.local_port(), discovery_.local_port(),
             options_.download_directory.string());
    return Result();
}

void Engine::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (stopped_) {
        return;
    }
    stopped_ = true;

    if (running_) {
        LOG_INFO("Stopping engine");
    }

    discovery_.stop();
    tcp_server_.stop();
    negotiator_.shutdown();
    running_ = false;
}

std::vector<network::Peer> Engine::get_users() const {
    return registry_.snapshot();
}

std::string Engine::get_own_address() const {
    return network::Endpoint{network::get_own_ip(), offer_port()}.to_string();
}

std::vector<network::NetworkInterfaceInfo> Engine::get_network_interfaces() const {
    return network::list_interfaces();
}

Settings Engine::get_settings() const {
    return settings_.get();
}

Result Engine::update_settings(const Settings& settings) {
    auto previous = settings_.get();
    auto result = settings_.update(settings);
    if (!result) {
        return result;
    }

    auto current = settings_.get();
    if (running_ && current.broadcasting_enabled &&
        (previous.username != current.username || !previous.broadcasting_enabled ||
         previous.broadcast_address != current.broadcast_address)) {
        discovery_.announce_now();
    }
    return result;
}

Result Engine::send_files(const std::string& recipient, const std::vector<std::string>& paths,
                          std::string& offer_id) {
    if (!running_) {
        return Result(ErrorCode::INVALID_STATE, "Engine is not running");
    }
    return negotiator_.propose(recipient, paths, offer_id);
}

Result Engine::accept_file_offer(const std::string& offer_id) {
    return negotiator_.accept(offer_id);
}

Result Engine::reject_file_offer(const std::string& offer_id) {
    return negotiator_.reject(offer_id);
}

std::vector<transfer::FileOffer> Engine::list_offers() const {
    return negotiator_.active_offers();
}

void Engine::refresh_peers() {
    if (!running_) {
        return;
    }
    discovery_.announce_now();
    discovery_.query_peers();
}

std::uint16_t Engine::offer_port() const {
    return tcp_server_.local_port();
}

std::uint16_t Engine::discovery_port() const {
    return discovery_.local_port();
}

}

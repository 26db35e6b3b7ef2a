#pragma once

#include "lanbeam/core/event_bus.hpp"
#include "lanbeam/core/result.hpp"
#include "lanbeam/core/settings_store.hpp"
#include "lanbeam/network/message_channel.hpp"
#include "lanbeam/network/peer_registry.hpp"
#include "lanbeam/transfer/file_offer.hpp"
#include "lanbeam/transfer/transfer_engine.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace lanbeam::transfer {

struct NegotiatorOptions {
    std::chrono::milliseconds proposal_timeout{60000};
    std::chrono::milliseconds connect_timeout{3000};
    std::chrono::milliseconds handshake_timeout{10000};

    // Proposer's extra wait for the receiver's expiry notice.
    std::chrono::milliseconds response_grace{5000};
};

// One worker thread per offer; at most one open offer per peer pair.
class OfferNegotiator {
public:
    OfferNegotiator(network::PeerRegistry& registry, TransferEngine& engine,
                    core::EventBus& events, const core::SettingsStore& settings,
                    NegotiatorOptions options);
    ~OfferNegotiator();

    OfferNegotiator(const OfferNegotiator&) = delete;
    OfferNegotiator& operator=(const OfferNegotiator&) = delete;

    // TCP port advertised as sender_port in proposals.
    void set_local_port(std::uint16_t port) { local_port_ = port; }

    // Returns once the proposal is on the wire; the answer arrives as an offer-resolved event.
    core::Result propose(const std::string& recipient, const std::vector<std::string>& paths,
                         std::string& offer_id);

    // Inbound PROPOSED offers only; anything else is UNKNOWN_OFFER.
    core::Result accept(const std::string& offer_id);
    core::Result reject(const std::string& offer_id);

    // PROPOSED and ACCEPTED offers, oldest first.
    std::vector<FileOffer> active_offers() const;
    std::optional<FileOffer> find_offer(const std::string& offer_id) const;

    // Takes ownership of an accepted inbound connection.
    void handle_connection(network::tcp::socket socket);

    // Cancels pending offers and sessions and joins every worker.
    void shutdown();

private:
    struct OfferRecord {
        FileOffer offer;
        std::string slot;
        bool slot_held = false;
        std::shared_ptr<network::MessageChannel> channel;
        std::vector<FileTransfer> sources;   // outbound only
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void run_outbound(std::shared_ptr<OfferRecord> record);
    void run_inbound(std::shared_ptr<network::MessageChannel> channel);

    void spawn_worker(std::function<void()> body);
    void reap_workers();

    // False once shutdown has begun; the channel is cancelled then.
    bool track_channel(const std::shared_ptr<network::MessageChannel>& channel);
    void untrack_channel(const std::shared_ptr<network::MessageChannel>& channel);

    // Caller holds mutex_.
    void release_slot_locked(OfferRecord& record);
    void evict_locked(const std::string& offer_id);

    // Frees the pair slot of a finished session so the next offer can go out.
    void settle(OfferRecord& record);

    void resolve_outbound(const std::shared_ptr<OfferRecord>& record, OfferStatus status,
                          const std::string& reason);

    static std::string outbound_slot(const std::string& peer) { return "out|" + peer; }
    static std::string inbound_slot(const std::string& peer) { return "in|" + peer; }

    network::PeerRegistry& registry_;
    TransferEngine& engine_;
    core::EventBus& events_;
    const core::SettingsStore& settings_;
    const NegotiatorOptions options_;
    std::atomic<std::uint16_t> local_port_;

    mutable std::mutex mutex_;
    std::condition_variable decision_cv_;
    std::map<std::string, std::shared_ptr<OfferRecord>> offers_;
    std::set<std::string> slots_;
    std::set<std::shared_ptr<network::MessageChannel>> channels_;
    bool shutting_down_;

    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
    bool workers_closed_;
};

}

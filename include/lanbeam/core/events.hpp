#pragma once

#include "lanbeam/core/result.hpp"
#include "lanbeam/network/peer_registry.hpp"
#include "lanbeam/network/protocol.hpp"
#include "lanbeam/transfer/transfer_session.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace lanbeam::core {

struct PeersUpdatedEvent {
    network::PeerChange change;
    network::Peer peer;
    std::vector<network::Peer> peers;
};

// Inbound offer waiting for accept / reject.
struct FileOfferEvent {
    std::string offer_id;
    std::string from;
    std::string sender_name;
    std::vector<network::OfferedFile> files;
    std::uint64_t total_size = 0;
};

enum class OfferOutcome {
    ACCEPTED,
    REJECTED,
    EXPIRED
};

const char* to_string(OfferOutcome outcome);

// Outbound offer answered or timed out. Reasons: "declined", "busy",
// "timeout", "expired", "disconnected".
struct OfferResolvedEvent {
    std::string offer_id;
    std::string peer;
    OfferOutcome outcome;
    std::string reason;
};

// file_path is set on the sender, file_name on the receiver.
struct TransferProgressEvent {
    std::string offer_id;
    std::optional<std::string> file_path;
    std::optional<std::string> file_name;
    std::uint32_t progress = 0;
};

struct TransferCompleteEvent {
    std::string offer_id;
    std::optional<std::string> file_path;
    std::optional<std::string> file_name;
    std::optional<std::string> saved_path;
};

struct SessionCompletedEvent {
    std::string offer_id;
    transfer::TransferRole role;
    std::size_t file_count = 0;
};

struct SessionFailedEvent {
    std::string offer_id;
    transfer::TransferRole role;
    ErrorCode error;
    std::string message;
    std::optional<std::string> file_name;
};

using Event = std::variant<
    PeersUpdatedEvent,
    FileOfferEvent,
    OfferResolvedEvent,
    TransferProgressEvent,
    TransferCompleteEvent,
    SessionCompletedEvent,
    SessionFailedEvent>;

// Notification name as seen by clients ("peers_updated", "file-offer", ...).
const char* event_name(const Event& event);

// Flattened key/value view used by the IPC `watch` stream. Lists use
// indexed keys: "file.0.name", "peer.1.address".
std::vector<std::pair<std::string, std::string>> event_fields(const Event& event);

}

#include "lanbeam/core/events.hpp"

namespace lanbeam::core {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

using Fields = std::vector<std::pair<std::string, std::string>>;

void add_optional(Fields& fields, const char* key, const std::optional<std::string>& value) {
    if (value) {
        fields.emplace_back(key, *value);
    }
}

}

const char* to_string(OfferOutcome outcome) {
    switch (outcome) {
        case OfferOutcome::ACCEPTED: return "accepted";
        case OfferOutcome::REJECTED: return "rejected";
        case OfferOutcome::EXPIRED:  return "expired";
    }
    return "unknown";
}

const char* event_name(const Event& event) {
    return std::visit(overloaded{
        [](const PeersUpdatedEvent&)     { return "peers_updated"; },
        [](const FileOfferEvent&)        { return "file-offer"; },
        [](const OfferResolvedEvent&)    { return "offer-resolved"; },
        [](const TransferProgressEvent&) { return "transfer-progress"; },
        [](const TransferCompleteEvent&) { return "transfer-complete"; },
        [](const SessionCompletedEvent&) { return "session-complete"; },
        [](const SessionFailedEvent&)    { return "session-failed"; },
    }, event);
}

std::vector<std::pair<std::string, std::string>> event_fields(const Event& event) {
    Fields fields;

    std::visit(overloaded{
        [&](const PeersUpdatedEvent& e) {
            fields.emplace_back("change", network::to_string(e.change));
            fields.emplace_back("address", e.peer.address);
            fields.emplace_back("username", e.peer.username);
            fields.emplace_back("peer.count", std::to_string(e.peers.size()));
            for (std::size_t i = 0; i < e.peers.size(); ++i) {
                auto prefix = "peer." + std::to_string(i) + ".";
                fields.emplace_back(prefix + "address", e.peers[i].address);
                fields.emplace_back(prefix + "username", e.peers[i].username);
            }
        },
        [&](const FileOfferEvent& e) {
            fields.emplace_back("id", e.offer_id);
            fields.emplace_back("from", e.from);
            fields.emplace_back("sender_name", e.sender_name);
            fields.emplace_back("total_size", std::to_string(e.total_size));
            fields.emplace_back("file.count", std::to_string(e.files.size()));
            for (std::size_t i = 0; i < e.files.size(); ++i) {
                auto prefix = "file." + std::to_string(i) + ".";
                fields.emplace_back(prefix + "name", e.files[i].name);
                fields.emplace_back(prefix + "size", std::to_string(e.files[i].size));
            }
        },
        [&](const OfferResolvedEvent& e) {
            fields.emplace_back("id", e.offer_id);
            fields.emplace_back("peer", e.peer);
            fields.emplace_back("outcome", to_string(e.outcome));
            fields.emplace_back("reason", e.reason);
        },
        [&](const TransferProgressEvent& e) {
            fields.emplace_back("offer_id", e.offer_id);
            add_optional(fields, "file_path", e.file_path);
            add_optional(fields, "file_name", e.file_name);
            fields.emplace_back("progress", std::to_string(e.progress));
        },
        [&](const TransferCompleteEvent& e) {
            fields.emplace_back("offer_id", e.offer_id);
            add_optional(fields, "file_path", e.file_path);
            add_optional(fields, "file_name", e.file_name);
            add_optional(fields, "saved_path", e.saved_path);
        },
        [&](const SessionCompletedEvent& e) {
            fields.emplace_back("offer_id", e.offer_id);
            fields.emplace_back("role", transfer::to_string(e.role));
            fields.emplace_back("file_count", std::to_string(e.file_count));
        },
        [&](const SessionFailedEvent& e) {
            fields.emplace_back("offer_id", e.offer_id);
            fields.emplace_back("role", transfer::to_string(e.role));
            fields.emplace_back("error", to_string(e.error));
            fields.emplace_back("message", e.message);
            add_optional(fields, "file_name", e.file_name);
        },
    }, event);

    return fields;
}

}

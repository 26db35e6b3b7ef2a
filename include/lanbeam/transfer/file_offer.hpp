#pragma once

#include "lanbeam/network/protocol.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace lanbeam::transfer {

enum class OfferStatus {
    PROPOSED,
    ACCEPTED,
    REJECTED,
    EXPIRED
};

enum class OfferDirection {
    OUTBOUND,
    INBOUND
};

const char* to_string(OfferStatus status);
const char* to_string(OfferDirection direction);

struct FileOffer {
    std::string id;                 // 128-bit random token, hex
    OfferDirection direction = OfferDirection::OUTBOUND;
    std::string peer;               // "ip:offer_port" of the other node
    std::string sender_name;
    std::vector<network::OfferedFile> files;
    std::uint64_t total_size = 0;
    OfferStatus status = OfferStatus::PROPOSED;
    std::chrono::steady_clock::time_point created;

    bool is_terminal() const {
        return status == OfferStatus::REJECTED || status == OfferStatus::EXPIRED;
    }
};

}

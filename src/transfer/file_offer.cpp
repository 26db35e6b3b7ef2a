#include "lanbeam/transfer/file_offer.hpp"

namespace lanbeam::transfer {

const char* to_string(OfferStatus status) {
    switch (status) {
        case OfferStatus::PROPOSED: return "proposed";
        case OfferStatus::ACCEPTED: return "accepted";
        case OfferStatus::REJECTED: return "rejected";
        case OfferStatus::EXPIRED:  return "expired";
    }
    return "unknown";
}

const char* to_string(OfferDirection direction) {
    switch (direction) {
        case OfferDirection::OUTBOUND: return "outbound";
        case OfferDirection::INBOUND:  return "inbound";
    }
    return "unknown";
}

}

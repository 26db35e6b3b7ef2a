#include "lanbeam/core/result.hpp"

namespace lanbeam::core {

ErrorCategory category_of(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:
            return ErrorCategory::NONE;
        case ErrorCode::BIND_FAILED:
        case ErrorCode::BROADCAST_FAILED:
            return ErrorCategory::DISCOVERY;
        case ErrorCode::PEER_UNREACHABLE:
        case ErrorCode::PEER_BUSY:
        case ErrorCode::UNKNOWN_OFFER:
        case ErrorCode::PROPOSAL_EXPIRED:
        case ErrorCode::OFFER_REJECTED:
            return ErrorCategory::NEGOTIATION;
        case ErrorCode::SOURCE_READ_FAILURE:
        case ErrorCode::DESTINATION_WRITE_FAILURE:
        case ErrorCode::PEER_DISCONNECTED:
        case ErrorCode::STALL_TIMEOUT:
        case ErrorCode::INTEGRITY_MISMATCH:
        case ErrorCode::PROTOCOL_VIOLATION:
        case ErrorCode::CANCELLED:
            return ErrorCategory::TRANSFER;
        default:
            return ErrorCategory::GENERAL;
    }
}

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:                   return "success";
        case ErrorCode::BIND_FAILED:               return "bind_failed";
        case ErrorCode::BROADCAST_FAILED:          return "broadcast_failed";
        case ErrorCode::PEER_UNREACHABLE:          return "peer_unreachable";
        case ErrorCode::PEER_BUSY:                 return "peer_busy";
        case ErrorCode::UNKNOWN_OFFER:             return "unknown_offer";
        case ErrorCode::PROPOSAL_EXPIRED:          return "proposal_expired";
        case ErrorCode::OFFER_REJECTED:            return "offer_rejected";
        case ErrorCode::SOURCE_READ_FAILURE:       return "source_read_failure";
        case ErrorCode::DESTINATION_WRITE_FAILURE: return "destination_write_failure";
        case ErrorCode::PEER_DISCONNECTED:         return "peer_disconnected";
        case ErrorCode::STALL_TIMEOUT:             return "stall_timeout";
        case ErrorCode::INTEGRITY_MISMATCH:        return "integrity_mismatch";
        case ErrorCode::PROTOCOL_VIOLATION:        return "protocol_violation";
        case ErrorCode::CANCELLED:                 return "cancelled";
        case ErrorCode::INVALID_ARGUMENT:          return "invalid_argument";
        case ErrorCode::SOURCE_UNREADABLE:         return "source_unreadable";
        case ErrorCode::PERSISTENCE_FAILED:        return "persistence_failed";
        case ErrorCode::INVALID_STATE:             return "invalid_state";
        case ErrorCode::INTERNAL_ERROR:            return "internal_error";
    }
    return "unknown";
}

const char* to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:        return "none";
        case ErrorCategory::DISCOVERY:   return "discovery";
        case ErrorCategory::NEGOTIATION: return "negotiation";
        case ErrorCategory::TRANSFER:    return "transfer";
        case ErrorCategory::GENERAL:     return "general";
    }
    return "unknown";
}

ErrorCode error_code_from_wire(std::uint32_t value) {
    auto code = static_cast<ErrorCode>(value);
    if (std::string(to_string(code)) == "unknown" || code == ErrorCode::SUCCESS) {
        return ErrorCode::PEER_DISCONNECTED;
    }
    return code;
}

std::string Result::describe() const {
    if (message.empty()) {
        return to_string(error);
    }
    return std::string(to_string(error)) + ": " + message;
}

}

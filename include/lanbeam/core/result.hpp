#pragma once

#include <cstdint>
#include <string>

namespace lanbeam::core {

enum class ErrorCategory {
    NONE,
    DISCOVERY,
    NEGOTIATION,
    TRANSFER,
    GENERAL
};

// Values travel inside TRANSFER_ABORT messages; never renumber.
enum class ErrorCode : std::uint32_t {
    SUCCESS                   = 0,

    BIND_FAILED               = 10,
    BROADCAST_FAILED          = 11,

    PEER_UNREACHABLE          = 20,
    PEER_BUSY                 = 21,
    UNKNOWN_OFFER             = 22,
    PROPOSAL_EXPIRED          = 23,
    OFFER_REJECTED            = 24,

    SOURCE_READ_FAILURE       = 30,
    DESTINATION_WRITE_FAILURE = 31,
    PEER_DISCONNECTED         = 32,
    STALL_TIMEOUT             = 33,
    INTEGRITY_MISMATCH        = 34,
    PROTOCOL_VIOLATION        = 35,
    CANCELLED                 = 36,

    INVALID_ARGUMENT          = 40,
    SOURCE_UNREADABLE         = 41,
    PERSISTENCE_FAILED        = 42,
    INVALID_STATE             = 43,
    INTERNAL_ERROR            = 99
};

ErrorCategory category_of(ErrorCode code);
const char* to_string(ErrorCode code);
const char* to_string(ErrorCategory category);

// Maps a code received from a peer back onto the enum; unknown values
// become PEER_DISCONNECTED.
ErrorCode error_code_from_wire(std::uint32_t value);

struct Result {
    ErrorCode error;
    std::string message;

    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }

    ErrorCategory category() const { return category_of(error); }

    // "<code>: <message>" for logs and command replies
    std::string describe() const;
};

}

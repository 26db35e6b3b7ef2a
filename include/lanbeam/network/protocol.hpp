#pragma once

#include <cstdint>
#include <array>
#include <string>
#include <vector>
#include <span>
#include <concepts>

namespace lanbeam::network {

constexpr std::uint32_t PROTOCOL_MAGIC = 0x4C4E424D; // "LNBM"
constexpr std::uint16_t PROTOCOL_VERSION = 1;
constexpr std::size_t MESSAGE_HEADER_SIZE = 32;
constexpr std::uint32_t MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;
constexpr std::size_t DIGEST_SIZE = 32;

enum class MessageType : std::uint8_t {
    PEER_ANNOUNCE   = 0x10,
    PEER_QUERY      = 0x11,
    PEER_RESPONSE   = 0x12,

    OFFER_PROPOSE   = 0x20,
    OFFER_RESPONSE  = 0x21,

    FILE_BEGIN      = 0x30,
    CHUNK_DATA      = 0x31,
    FILE_END        = 0x32,
    FILE_ACK        = 0x33,
    TRANSFER_ABORT  = 0x3F
};

enum class MessageFlags : std::uint8_t {
    NONE            = 0x00
};

const char* to_string(MessageType type);

struct MessageHeader {
    std::uint32_t magic;           // Protocol magic number
    std::uint16_t version;         // Protocol version
    MessageType type;              // Message type
    MessageFlags flags;            // Message flags
    std::uint64_t message_id;      // Unique message ID
    std::uint32_t payload_size;    // Payload length in bytes
    std::uint64_t timestamp;       // Unix timestamp (nanoseconds)
    std::array<std::uint8_t, 4> checksum; // CRC32 of payload

    MessageHeader();
    MessageHeader(MessageType msg_type, std::uint32_t payload_len);

    // Magic, version and payload limit.
    bool is_valid() const;
    void calculate_checksum(std::span<const std::uint8_t> payload);
    bool verify_checksum(std::span<const std::uint8_t> payload) const;

    std::vector<std::uint8_t> serialize() const;
    static MessageHeader deserialize(std::span<const std::uint8_t> data);
} __attribute__((packed));

static_assert(sizeof(MessageHeader) == MESSAGE_HEADER_SIZE);

std::uint32_t crc32(std::span<const std::uint8_t> data);

template<typename T>
concept MessagePayload = requires(T t) {
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
    { T::deserialize(std::declval<std::span<const std::uint8_t>>()) } -> std::same_as<T>;
};

// PEER_ANNOUNCE / PEER_RESPONSE
struct PresenceMessage {
    std::uint64_t instance_id;
    std::string username;
    std::uint16_t offer_port;

    std::vector<std::uint8_t> serialize() const;
    static PresenceMessage deserialize(std::span<const std::uint8_t> data);
};

// PEER_QUERY
struct PeerQueryMessage {
    std::uint64_t instance_id;

    std::vector<std::uint8_t> serialize() const;
    static PeerQueryMessage deserialize(std::span<const std::uint8_t> data);
};

struct OfferedFile {
    std::string name;
    std::uint64_t size;

    bool operator==(const OfferedFile&) const = default;
};

struct OfferProposeMessage {
    std::string offer_id;
    std::string sender_name;
    std::uint16_t sender_port;
    std::vector<OfferedFile> files;

    std::vector<std::uint8_t> serialize() const;
    static OfferProposeMessage deserialize(std::span<const std::uint8_t> data);
};

enum class OfferReply : std::uint8_t {
    ACCEPTED = 0,
    DECLINED = 1,
    BUSY     = 2,
    EXPIRED  = 3
};

struct OfferResponseMessage {
    std::string offer_id;
    OfferReply reply;

    bool accepted() const { return reply == OfferReply::ACCEPTED; }

    std::vector<std::uint8_t> serialize() const;
    static OfferResponseMessage deserialize(std::span<const std::uint8_t> data);
};

struct FileBeginMessage {
    std::uint32_t file_index;
    std::string name;
    std::uint64_t size;

    std::vector<std::uint8_t> serialize() const;
    static FileBeginMessage deserialize(std::span<const std::uint8_t> data);
};

struct ChunkDataMessage {
    std::uint32_t file_index;
    std::uint64_t offset;
    std::vector<std::uint8_t> data;

    std::vector<std::uint8_t> serialize() const;
    static ChunkDataMessage deserialize(std::span<const std::uint8_t> data);
};

struct FileEndMessage {
    std::uint32_t file_index;
    std::array<std::uint8_t, DIGEST_SIZE> digest;

    std::vector<std::uint8_t> serialize() const;
    static FileEndMessage deserialize(std::span<const std::uint8_t> data);
};

struct FileAckMessage {
    std::uint32_t file_index;
    std::string saved_name;

    std::vector<std::uint8_t> serialize() const;
    static FileAckMessage deserialize(std::span<const std::uint8_t> data);
};

struct TransferAbortMessage {
    std::uint32_t error_code;
    std::string message;

    std::vector<std::uint8_t> serialize() const;
    static TransferAbortMessage deserialize(std::span<const std::uint8_t> data);
};

struct Frame {
    MessageHeader header;
    std::vector<std::uint8_t> payload;
};

// Header + payload with the checksum filled in.
std::vector<std::uint8_t> frame_payload(MessageType type, std::span<const std::uint8_t> payload);

template<MessagePayload T>
std::vector<std::uint8_t> frame_message(MessageType type, const T& message) {
    auto payload = message.serialize();
    return frame_payload(type, payload);
}

// Parses one complete frame (a datagram). Throws std::runtime_error on a
// bad header, a size mismatch or a checksum failure.
Frame deserialize_frame(std::span<const std::uint8_t> data);

}

static_assert(lanbeam::network::MessagePayload<lanbeam::network::PresenceMessage>);
static_assert(lanbeam::network::MessagePayload<lanbeam::network::OfferProposeMessage>);
static_assert(lanbeam::network::MessagePayload<lanbeam::network::ChunkDataMessage>);

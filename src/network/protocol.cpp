#include "lanbeam/network/protocol.hpp"
#include <chrono>
#include <random>
#include <mutex>
#include <stdexcept>
#include <algorithm>

namespace lanbeam::network {

namespace {
    constexpr std::size_t MAX_OFFERED_FILES = 100000;

    std::uint64_t generate_message_id() {
        static std::mutex mutex;
        static std::random_device rd;
        static std::mt19937_64 gen(rd());
        std::lock_guard<std::mutex> lock(mutex);
        return gen();
    }

    std::uint64_t get_timestamp_ns() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            now.time_since_epoch()).count();
    }

    constexpr std::array<std::uint32_t, 256> make_crc_table() {
        std::array<std::uint32_t, 256> table{};
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            table[i] = c;
        }
        return table;
    }

    constexpr auto crc_table = make_crc_table();

    static_assert(crc_table[1] == 0x77073096);

    void write_uint8(std::vector<std::uint8_t>& buffer, std::uint8_t value) {
        buffer.push_back(value);
    }

    void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }

    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }

    void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
        write_uint32(buffer, static_cast<std::uint32_t>(value >> 32));
        write_uint32(buffer, static_cast<std::uint32_t>(value & 0xFFFFFFFF));
    }

    void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
        write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
        buffer.insert(buffer.end(), str.begin(), str.end());
    }

    std::uint8_t read_uint8(std::span<const std::uint8_t>& data) {
        if (data.empty()) throw std::runtime_error("Insufficient data for uint8");
        auto value = data[0];
        data = data.subspan(1);
        return value;
    }

    std::uint16_t read_uint16(std::span<const std::uint8_t>& data) {
        if (data.size() < 2) throw std::runtime_error("Insufficient data for uint16");
        std::uint16_t value = (static_cast<std::uint16_t>(data[0]) << 8) |
                             static_cast<std::uint16_t>(data[1]);
        data = data.subspan(2);
        return value;
    }

    std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
        if (data.size() < 4) throw std::runtime_error("Insufficient data for uint32");
        std::uint32_t value = (static_cast<std::uint32_t>(data[0]) << 24) |
                             (static_cast<std::uint32_t>(data[1]) << 16) |
                             (static_cast<std::uint32_t>(data[2]) << 8) |
                             static_cast<std::uint32_t>(data[3]);
        data = data.subspan(4);
        return value;
    }

    std::uint64_t read_uint64(std::span<const std::uint8_t>& data) {
        std::uint64_t high = read_uint32(data);
        std::uint64_t low = read_uint32(data);
        return (high << 32) | low;
    }

    std::string read_string(std::span<const std::uint8_t>& data) {
        auto length = read_uint32(data);
        if (data.size() < length) throw std::runtime_error("Insufficient data for string");
        std::string str(reinterpret_cast<const char*>(data.data()), length);
        data = data.subspan(length);
        return str;
    }
}

const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::PEER_ANNOUNCE:  return "PEER_ANNOUNCE";
        case MessageType::PEER_QUERY:     return "PEER_QUERY";
        case MessageType::PEER_RESPONSE:  return "PEER_RESPONSE";
        case MessageType::OFFER_PROPOSE:  return "OFFER_PROPOSE";
        case MessageType::OFFER_RESPONSE: return "OFFER_RESPONSE";
        case MessageType::FILE_BEGIN:     return "FILE_BEGIN";
        case MessageType::CHUNK_DATA:     return "CHUNK_DATA";
        case MessageType::FILE_END:       return "FILE_END";
        case MessageType::FILE_ACK:       return "FILE_ACK";
        case MessageType::TRANSFER_ABORT: return "TRANSFER_ABORT";
    }
    return "UNKNOWN";
}

std::uint32_t crc32(std::span<const std::uint8_t> data) {
    std::uint32_t crc = 0xFFFFFFFF;
    for (auto byte : data) {
        crc = crc_table[(crc ^ byte) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

MessageHeader::MessageHeader()
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(MessageType::PEER_ANNOUNCE)
    , flags(MessageFlags::NONE)
    , message_id(0)
    , payload_size(0)
    , timestamp(0)
    , checksum{0, 0, 0, 0} {
}

MessageHeader::MessageHeader(MessageType msg_type, std::uint32_t payload_len)
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(msg_type)
    , flags(MessageFlags::NONE)
    , message_id(generate_message_id())
    , payload_size(payload_len)
    , timestamp(get_timestamp_ns())
    , checksum{0, 0, 0, 0} {
}

bool MessageHeader::is_valid() const {
    return magic == PROTOCOL_MAGIC &&
           version == PROTOCOL_VERSION &&
           payload_size <= MAX_PAYLOAD_SIZE;
}

void MessageHeader::calculate_checksum(std::span<const std::uint8_t> payload) {
    auto crc = crc32(payload);
    checksum[0] = (crc >> 24) & 0xFF;
    checksum[1] = (crc >> 16) & 0xFF;
    checksum[2] = (crc >> 8) & 0xFF;
    checksum[3] = crc & 0xFF;
}

bool MessageHeader::verify_checksum(std::span<const std::uint8_t> payload) const {
    auto expected_crc = crc32(payload);
    auto actual_crc = (static_cast<std::uint32_t>(checksum[0]) << 24) |
                     (static_cast<std::uint32_t>(checksum[1]) << 16) |
                     (static_cast<std::uint32_t>(checksum[2]) << 8) |
                     static_cast<std::uint32_t>(checksum[3]);
    return expected_crc == actual_crc;
}

std::vector<std::uint8_t> MessageHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(MESSAGE_HEADER_SIZE);

    write_uint32(buffer, magic);
    write_uint16(buffer, version);
    buffer.push_back(static_cast<std::uint8_t>(type));
    buffer.push_back(static_cast<std::uint8_t>(flags));
    write_uint64(buffer, message_id);
    write_uint32(buffer, payload_size);
    write_uint64(buffer, timestamp);
    buffer.insert(buffer.end(), checksum.begin(), checksum.end());

    return buffer;
}

MessageHeader MessageHeader::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < MESSAGE_HEADER_SIZE) {
        throw std::runtime_error("Insufficient data for message header");
    }

    MessageHeader header;
    auto span = data;

    header.magic = read_uint32(span);
    header.version = read_uint16(span);
    header.type = static_cast<MessageType>(read_uint8(span));
    header.flags = static_cast<MessageFlags>(read_uint8(span));
    header.message_id = read_uint64(span);
    header.payload_size = read_uint32(span);
    header.timestamp = read_uint64(span);
    std::copy(span.begin(), span.begin() + 4, header.checksum.begin());

    return header;
}

std::vector<std::uint8_t> PresenceMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint64(buffer, instance_id);
    write_string(buffer, username);
    write_uint16(buffer, offer_port);
    return buffer;
}

PresenceMessage PresenceMessage::deserialize(std::span<const std::uint8_t> data) {
    PresenceMessage msg;
    auto span = data;
    msg.instance_id = read_uint64(span);
    msg.username = read_string(span);
    msg.offer_port = read_uint16(span);
    return msg;
}

std::vector<std::uint8_t> PeerQueryMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint64(buffer, instance_id);
    return buffer;
}

PeerQueryMessage PeerQueryMessage::deserialize(std::span<const std::uint8_t> data) {
    PeerQueryMessage msg;
    auto span = data;
    msg.instance_id = read_uint64(span);
    return msg;
}

std::vector<std::uint8_t> OfferProposeMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, offer_id);
    write_string(buffer, sender_name);
    write_uint16(buffer, sender_port);
    write_uint32(buffer, static_cast<std::uint32_t>(files.size()));
    for (const auto& file : files) {
        write_string(buffer, file.name);
        write_uint64(buffer, file.size);
    }
    return buffer;
}

OfferProposeMessage OfferProposeMessage::deserialize(std::span<const std::uint8_t> data) {
    OfferProposeMessage msg;
    auto span = data;
    msg.offer_id = read_string(span);
    msg.sender_name = read_string(span);
    msg.sender_port = read_uint16(span);
    auto file_count = read_uint32(span);
    if (file_count > MAX_OFFERED_FILES) {
        throw std::runtime_error("Too many files in offer");
    }
    msg.files.reserve(file_count);
    for (std::uint32_t i = 0; i < file_count; ++i) {
        OfferedFile file;
        file.name = read_string(span);
        file.size = read_uint64(span);
        msg.files.push_back(std::move(file));
    }
    return msg;
}

std::vector<std::uint8_t> OfferResponseMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, offer_id);
    write_uint8(buffer, static_cast<std::uint8_t>(reply));
    return buffer;
}

OfferResponseMessage OfferResponseMessage::deserialize(std::span<const std::uint8_t> data) {
    OfferResponseMessage msg;
    auto span = data;
    msg.offer_id = read_string(span);
    auto reply = read_uint8(span);
    if (reply > static_cast<std::uint8_t>(OfferReply::EXPIRED)) {
        throw std::runtime_error("Unknown offer reply");
    }
    msg.reply = static_cast<OfferReply>(reply);
    return msg;
}

std::vector<std::uint8_t> FileBeginMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, file_index);
    write_string(buffer, name);
    write_uint64(buffer, size);
    return buffer;
}

FileBeginMessage FileBeginMessage::deserialize(std::span<const std::uint8_t> data) {
    FileBeginMessage msg;
    auto span = data;
    msg.file_index = read_uint32(span);
    msg.name = read_string(span);
    msg.size = read_uint64(span);
    return msg;
}

std::vector<std::uint8_t> ChunkDataMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(16 + data.size());
    write_uint32(buffer, file_index);
    write_uint64(buffer, offset);
    write_uint32(buffer, static_cast<std::uint32_t>(data.size()));
    buffer.insert(buffer.end(), data.begin(), data.end());
    return buffer;
}

ChunkDataMessage ChunkDataMessage::deserialize(std::span<const std::uint8_t> data_span) {
    ChunkDataMessage msg;
    auto span = data_span;
    msg.file_index = read_uint32(span);
    msg.offset = read_uint64(span);
    auto data_size = read_uint32(span);
    if (span.size() < data_size) throw std::runtime_error("Insufficient data for chunk");
    msg.data.assign(span.begin(), span.begin() + data_size);
    return msg;
}

std::vector<std::uint8_t> FileEndMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, file_index);
    buffer.insert(buffer.end(), digest.begin(), digest.end());
    return buffer;
}

FileEndMessage FileEndMessage::deserialize(std::span<const std::uint8_t> data) {
    FileEndMessage msg;
    auto span = data;
    msg.file_index = read_uint32(span);
    if (span.size() < DIGEST_SIZE) throw std::runtime_error("Insufficient data for digest");
    std::copy(span.begin(), span.begin() + DIGEST_SIZE, msg.digest.begin());
    return msg;
}

std::vector<std::uint8_t> FileAckMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, file_index);
    write_string(buffer, saved_name);
    return buffer;
}

FileAckMessage FileAckMessage::deserialize(std::span<const std::uint8_t> data) {
    FileAckMessage msg;
    auto span = data;
    msg.file_index = read_uint32(span);
    msg.saved_name = read_string(span);
    return msg;
}

std::vector<std::uint8_t> TransferAbortMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, error_code);
    write_string(buffer, message);
    return buffer;
}

TransferAbortMessage TransferAbortMessage::deserialize(std::span<const std::uint8_t> data) {
    TransferAbortMessage msg;
    auto span = data;
    msg.error_code = read_uint32(span);
    msg.message = read_string(span);
    return msg;
}

std::vector<std::uint8_t> frame_payload(MessageType type, std::span<const std::uint8_t> payload) {
    if (payload.size() > MAX_PAYLOAD_SIZE) {
        throw std::runtime_error("Payload exceeds protocol limit");
    }

    MessageHeader header(type, static_cast<std::uint32_t>(payload.size()));
    header.calculate_checksum(payload);

    auto frame = header.serialize();
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

Frame deserialize_frame(std::span<const std::uint8_t> data) {
    Frame frame;
    frame.header = MessageHeader::deserialize(data);

    if (!frame.header.is_valid()) {
        throw std::runtime_error("Invalid message header");
    }

    auto payload = data.subspan(MESSAGE_HEADER_SIZE);
    if (payload.size() != frame.header.payload_size) {
        throw std::runtime_error("Payload size mismatch");
    }

    if (!frame.header.verify_checksum(payload)) {
        throw std::runtime_error("Payload checksum mismatch");
    }

    frame.payload.assign(payload.begin(), payload.end());
    return frame;
}

}

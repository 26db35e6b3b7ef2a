#include <gtest/gtest.h>
#include "lanbeam/network/protocol.hpp"
#include <cstring>
#include <stdexcept>

using namespace lanbeam::network;

// MessageHeader is packed; copy fields out before handing them to gtest.
template<typename T>
T field(T value) {
    return value;
}

class ProtocolTest : public ::testing::Test {};

TEST_F(ProtocolTest, MessageHeaderConstruction) {
    MessageHeader header(MessageType::PEER_ANNOUNCE, 0);

    EXPECT_EQ(field(header.magic), PROTOCOL_MAGIC);
    EXPECT_EQ(field(header.version), PROTOCOL_VERSION);
    EXPECT_TRUE(header.is_valid());
    EXPECT_GT(field(header.message_id), 0u);
    EXPECT_GT(field(header.timestamp), 0u);

    MessageHeader other(MessageType::PEER_ANNOUNCE, 0);
    EXPECT_NE(field(other.message_id), field(header.message_id));
}

TEST_F(ProtocolTest, MessageHeaderSerialization) {
    MessageHeader original(MessageType::CHUNK_DATA, 50);

    auto serialized = original.serialize();
    ASSERT_EQ(serialized.size(), MESSAGE_HEADER_SIZE);

    // Magic is written big-endian: "LNBM"
    EXPECT_EQ(std::memcmp(serialized.data(), "LNBM", 4), 0);

    auto deserialized = MessageHeader::deserialize(serialized);
    EXPECT_EQ(field(deserialized.magic), field(original.magic));
    EXPECT_EQ(field(deserialized.version), field(original.version));
    EXPECT_EQ(field(deserialized.type), MessageType::CHUNK_DATA);
    EXPECT_EQ(field(deserialized.message_id), field(original.message_id));
    EXPECT_EQ(field(deserialized.payload_size), 50u);
    EXPECT_EQ(field(deserialized.timestamp), field(original.timestamp));
}

TEST_F(ProtocolTest, HeaderValidation) {
    MessageHeader header(MessageType::FILE_BEGIN, 10);
    EXPECT_TRUE(header.is_valid());

    header.magic = 0xDEADBEEF;
    EXPECT_FALSE(header.is_valid());

    header.magic = PROTOCOL_MAGIC;
    header.version = PROTOCOL_VERSION + 1;
    EXPECT_FALSE(header.is_valid());

    header.version = PROTOCOL_VERSION;
    header.payload_size = MAX_PAYLOAD_SIZE + 1;
    EXPECT_FALSE(header.is_valid());
}

TEST_F(ProtocolTest, ChecksumCalculation) {
    std::vector<std::uint8_t> payload = {1, 2, 3, 4, 5};
    MessageHeader header(MessageType::CHUNK_DATA, static_cast<std::uint32_t>(payload.size()));

    header.calculate_checksum(payload);
    EXPECT_TRUE(header.verify_checksum(payload));

    payload[2] = 99;
    EXPECT_FALSE(header.verify_checksum(payload));
}

TEST_F(ProtocolTest, Crc32KnownValue) {
    const std::string input = "123456789";
    std::vector<std::uint8_t> bytes(input.begin(), input.end());
    EXPECT_EQ(crc32(bytes), 0xCBF43926u);
}

TEST_F(ProtocolTest, PresenceMessage) {
    PresenceMessage original{0x0102030405060708ull, "alice-laptop", 53318};

    auto restored = PresenceMessage::deserialize(original.serialize());
    EXPECT_EQ(restored.instance_id, original.instance_id);
    EXPECT_EQ(restored.username, "alice-laptop");
    EXPECT_EQ(restored.offer_port, 53318);
}

TEST_F(ProtocolTest, OfferProposeKeepsFileOrder) {
    OfferProposeMessage original;
    original.offer_id = "a1b2c3";
    original.sender_name = "bob";
    original.sender_port = 40001;
    original.files = {{"z.txt", 10}, {"a.bin", 0}, {"m.iso", 5ull * 1024 * 1024 * 1024}};

    auto restored = OfferProposeMessage::deserialize(original.serialize());
    EXPECT_EQ(restored.offer_id, original.offer_id);
    EXPECT_EQ(restored.sender_name, original.sender_name);
    EXPECT_EQ(restored.sender_port, original.sender_port);
    EXPECT_EQ(restored.files, original.files);
}

TEST_F(ProtocolTest, OfferResponseRejectsUnknownReply) {
    OfferResponseMessage response{"id", OfferReply::BUSY};
    auto payload = response.serialize();

    auto restored = OfferResponseMessage::deserialize(payload);
    EXPECT_EQ(restored.reply, OfferReply::BUSY);
    EXPECT_FALSE(restored.accepted());

    payload.back() = 0x7F;
    EXPECT_THROW(OfferResponseMessage::deserialize(payload), std::runtime_error);
}

TEST_F(ProtocolTest, TransferMessages) {
    ChunkDataMessage chunk{2, 65536, {0xDE, 0xAD, 0xBE, 0xEF}};
    auto chunk_restored = ChunkDataMessage::deserialize(chunk.serialize());
    EXPECT_EQ(chunk_restored.file_index, 2u);
    EXPECT_EQ(chunk_restored.offset, 65536u);
    EXPECT_EQ(chunk_restored.data, chunk.data);

    FileEndMessage end{2, {}};
    end.digest.fill(0xAB);
    auto end_restored = FileEndMessage::deserialize(end.serialize());
    EXPECT_EQ(end_restored.digest, end.digest);

    TransferAbortMessage abort{34, "digest mismatch"};
    auto abort_restored = TransferAbortMessage::deserialize(abort.serialize());
    EXPECT_EQ(abort_restored.error_code, 34u);
    EXPECT_EQ(abort_restored.message, "digest mismatch");
}

TEST_F(ProtocolTest, TruncatedPayloadThrows) {
    FileBeginMessage begin{0, "report.pdf", 1024};
    auto payload = begin.serialize();
    payload.resize(payload.size() - 3);

    EXPECT_THROW(FileBeginMessage::deserialize(payload), std::runtime_error);
    EXPECT_THROW(PresenceMessage::deserialize(std::vector<std::uint8_t>{}), std::runtime_error);
}

TEST_F(ProtocolTest, FrameRoundTrip) {
    PresenceMessage presence{42, "carol", 53318};
    auto bytes = frame_message(MessageType::PEER_ANNOUNCE, presence);
    ASSERT_GT(bytes.size(), MESSAGE_HEADER_SIZE);

    auto frame = deserialize_frame(bytes);
    EXPECT_EQ(field(frame.header.type), MessageType::PEER_ANNOUNCE);

    auto restored = PresenceMessage::deserialize(frame.payload);
    EXPECT_EQ(restored.username, "carol");
}

TEST_F(ProtocolTest, CorruptFramesAreRejected) {
    auto bytes = frame_message(MessageType::PEER_QUERY, PeerQueryMessage{7});

    auto corrupted = bytes;
    corrupted.back() ^= 0xFF;
    EXPECT_THROW(deserialize_frame(corrupted), std::runtime_error);

    auto truncated = bytes;
    truncated.pop_back();
    EXPECT_THROW(deserialize_frame(truncated), std::runtime_error);

    auto wrong_magic = bytes;
    wrong_magic[0] = 'X';
    EXPECT_THROW(deserialize_frame(wrong_magic), std::runtime_error);

    std::vector<std::uint8_t> garbage(10, 0x55);
    EXPECT_THROW(deserialize_frame(garbage), std::runtime_error);
}

TEST_F(ProtocolTest, MessageTypeNames) {
    EXPECT_STREQ(to_string(MessageType::OFFER_PROPOSE), "OFFER_PROPOSE");
    EXPECT_STREQ(to_string(MessageType::TRANSFER_ABORT), "TRANSFER_ABORT");
}

#include <gtest/gtest.h>
#include "lanbeam/network/message_channel.hpp"
#include <boost/asio.hpp>
#include <future>
#include <memory>
#include <thread>

using namespace lanbeam::network;
using lanbeam::core::ErrorCode;
using namespace std::chrono_literals;

class MessageChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        acceptor = std::make_unique<tcp::acceptor>(
            io_context, tcp::endpoint(boost::asio::ip::make_address_v4("127.0.0.1"), 0));
        port = acceptor->local_endpoint().port();
    }

    void TearDown() override {
        boost::system::error_code ec;
        acceptor->close(ec);
    }

    // Accepts one connection on a helper thread and wraps it in a channel.
    std::future<std::unique_ptr<MessageChannel>> accept_async() {
        return std::async(std::launch::async, [this]() {
            tcp::socket socket(io_context);
            acceptor->accept(socket);
            return std::make_unique<MessageChannel>(std::move(socket));
        });
    }

    Endpoint local_endpoint() const { return Endpoint{"127.0.0.1", port}; }

    boost::asio::io_context io_context;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::uint16_t port = 0;
};

TEST_F(MessageChannelTest, ExchangesFramesBothWays) {
    auto accepted = accept_async();

    MessageChannel client;
    ASSERT_TRUE(client.connect(local_endpoint(), 2000ms));
    auto server = accepted.get();
    ASSERT_TRUE(server->is_open());
    EXPECT_EQ(server->remote_address(), "127.0.0.1");
    EXPECT_EQ(client.remote_address(), "127.0.0.1");

    OfferProposeMessage propose{"a1b2", "alice", 53318, {{"notes.txt", 12}, {"photo.jpg", 4096}}};
    ASSERT_TRUE(client.send_message(MessageType::OFFER_PROPOSE, propose, 2000ms));

    Frame frame;
    ASSERT_TRUE(server->receive(frame, 2000ms));
    EXPECT_EQ(frame.header.type, MessageType::OFFER_PROPOSE);
    auto decoded = OfferProposeMessage::deserialize(frame.payload);
    EXPECT_EQ(decoded.offer_id, "a1b2");
    EXPECT_EQ(decoded.sender_name, "alice");
    ASSERT_EQ(decoded.files.size(), 2u);
    EXPECT_EQ(decoded.files[1].name, "photo.jpg");

    OfferResponseMessage reply{"a1b2", OfferReply::DECLINED};
    ASSERT_TRUE(server->send_message(MessageType::OFFER_RESPONSE, reply, 2000ms));

    ASSERT_TRUE(client.receive(frame, 2000ms));
    EXPECT_EQ(frame.header.type, MessageType::OFFER_RESPONSE);
    EXPECT_EQ(OfferResponseMessage::deserialize(frame.payload).reply, OfferReply::DECLINED);
}

TEST_F(MessageChannelTest, LargeChunkArrivesIntact) {
    auto accepted = accept_async();

    MessageChannel client;
    ASSERT_TRUE(client.connect(local_endpoint(), 2000ms));
    auto server = accepted.get();

    ChunkDataMessage chunk;
    chunk.file_index = 3;
    chunk.offset = 1u << 20;
    chunk.data.resize(256 * 1024);
    for (std::size_t i = 0; i < chunk.data.size(); ++i) {
        chunk.data[i] = static_cast<std::uint8_t>(i * 31);
    }

    // The writer blocks until the reader drains the socket.
    auto sender = std::async(std::launch::async, [&]() {
        return client.send_message(MessageType::CHUNK_DATA, chunk, 5000ms);
    });

    Frame frame;
    ASSERT_TRUE(server->receive(frame, 5000ms));
    EXPECT_TRUE(sender.get());

    auto decoded = ChunkDataMessage::deserialize(frame.payload);
    EXPECT_EQ(decoded.file_index, 3u);
    EXPECT_EQ(decoded.offset, 1u << 20);
    EXPECT_EQ(decoded.data, chunk.data);
}

TEST_F(MessageChannelTest, ReceiveTimesOutAsStall) {
    auto accepted = accept_async();

    MessageChannel client;
    ASSERT_TRUE(client.connect(local_endpoint(), 2000ms));
    auto server = accepted.get();

    Frame frame;
    auto start = std::chrono::steady_clock::now();
    auto result = server->receive(frame, 150ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.error, ErrorCode::STALL_TIMEOUT);
    EXPECT_GE(elapsed, 150ms);
    EXPECT_FALSE(server->is_open());
}

TEST_F(MessageChannelTest, PeerCloseIsDisconnect) {
    auto accepted = accept_async();

    MessageChannel client;
    ASSERT_TRUE(client.connect(local_endpoint(), 2000ms));
    auto server = accepted.get();
    client.close();

    Frame frame;
    EXPECT_EQ(server->receive(frame, 2000ms).error, ErrorCode::PEER_DISCONNECTED);
    EXPECT_EQ(server->send(MessageType::FILE_ACK, {}, 100ms).error, ErrorCode::PEER_DISCONNECTED);
}

TEST_F(MessageChannelTest, CancelInterruptsBlockedReceive) {
    auto accepted = accept_async();

    MessageChannel client;
    ASSERT_TRUE(client.connect(local_endpoint(), 2000ms));
    auto server = accepted.get();

    auto receiver = std::async(std::launch::async, [&]() {
        Frame frame;
        return server->receive(frame, 10000ms);
    });

    std::this_thread::sleep_for(100ms);
    server->cancel();

    ASSERT_EQ(receiver.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(receiver.get().error, ErrorCode::CANCELLED);
    EXPECT_TRUE(server->is_cancelled());

    Frame frame;
    EXPECT_EQ(server->receive(frame, 100ms).error, ErrorCode::CANCELLED);
}

TEST_F(MessageChannelTest, CorruptFrameIsProtocolViolation) {
    auto accepted = accept_async();

    tcp::socket raw(io_context);
    raw.connect(tcp::endpoint(boost::asio::ip::make_address_v4("127.0.0.1"), port));
    auto server = accepted.get();

    OfferResponseMessage reply{"ff00", OfferReply::ACCEPTED};
    auto payload = reply.serialize();
    auto frame = frame_payload(MessageType::OFFER_RESPONSE, payload);
    frame.back() ^= 0xFF;
    boost::asio::write(raw, boost::asio::buffer(frame));

    Frame received;
    EXPECT_EQ(server->receive(received, 2000ms).error, ErrorCode::PROTOCOL_VIOLATION);
    EXPECT_FALSE(server->is_open());
}

TEST_F(MessageChannelTest, ConnectToClosedPortIsUnreachable) {
    boost::system::error_code ec;
    acceptor->close(ec);

    MessageChannel client;
    auto result = client.connect(local_endpoint(), 1000ms);
    EXPECT_EQ(result.error, ErrorCode::PEER_UNREACHABLE);
}

TEST_F(MessageChannelTest, InvalidAddressIsUnreachable) {
    MessageChannel client;
    EXPECT_EQ(client.connect(Endpoint{"not-an-ip", 53318}, 500ms).error, ErrorCode::PEER_UNREACHABLE);
}

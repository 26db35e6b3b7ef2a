#include "lanbeam/network/message_channel.hpp"
#include "lanbeam/core/logger.hpp"
#include <array>
#include <unistd.h>

namespace lanbeam::network {

MessageChannel::MessageChannel()
    : io_context_()
    , socket_(io_context_)
    , cancelled_(false) {
}

MessageChannel::MessageChannel(tcp::socket&& accepted)
    : io_context_()
    , socket_(io_context_)
    , cancelled_(false) {
    boost::system::error_code ec;
    auto remote = accepted.remote_endpoint(ec);
    if (!ec) {
        remote_address_ = remote.address().to_string();
    }

    auto protocol = remote.protocol();
    auto handle = accepted.release(ec);
    if (ec) {
        LOG_ERROR("Failed to detach accepted socket: {}", ec.message());
        return;
    }
    socket_.assign(protocol, handle, ec);
    if (ec) {
        LOG_ERROR("Failed to adopt accepted socket: {}", ec.message());
        ::close(handle);
    }
}

MessageChannel::~MessageChannel() {
    close();
}

core::Result MessageChannel::connect(const Endpoint& endpoint, Duration timeout) {
    if (cancelled_) {
        return core::Result(core::ErrorCode::CANCELLED, "Channel cancelled");
    }

    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address_v4(endpoint.ip, ec);
    if (ec) {
        return core::Result(core::ErrorCode::PEER_UNREACHABLE, "Invalid address " + endpoint.ip);
    }

    tcp::endpoint target(address, endpoint.port);
    remote_address_ = endpoint.ip;

    ec = boost::asio::error::would_block;
    socket_.async_connect(target, [&](const boost::system::error_code& result) {
        ec = result;
    });

    bool timed_out = run_for(timeout);
    if (ec || timed_out) {
        return fail(ec, timed_out, core::ErrorCode::PEER_UNREACHABLE,
                    "connect to " + endpoint.to_string());
    }

    socket_.set_option(tcp::no_delay(true), ec);
    LOG_DEBUG("Connected to {}", endpoint.to_string());
    return core::Result();
}

core::Result MessageChannel::send(MessageType type, std::span<const std::uint8_t> payload, Duration timeout) {
    if (auto usable = check_usable(); !usable) {
        return usable;
    }

    std::vector<std::uint8_t> frame;
    try {
        frame = frame_payload(type, payload);
    } catch (const std::exception& e) {
        return core::Result(core::ErrorCode::PROTOCOL_VIOLATION, e.what());
    }

    boost::system::error_code ec = boost::asio::error::would_block;
    boost::asio::async_write(socket_, boost::asio::buffer(frame),
        [&](const boost::system::error_code& result, std::size_t) {
            ec = result;
        });

    bool timed_out = run_for(timeout);
    if (ec || timed_out) {
        return fail(ec, timed_out, core::ErrorCode::STALL_TIMEOUT,
                    std::string("send ") + to_string(type));
    }

    LOG_TRACE("Sent {} ({} bytes) to {}", to_string(type), payload.size(), remote_address_);
    return core::Result();
}

core::Result MessageChannel::receive(Frame& frame, Duration timeout) {
    if (auto usable = check_usable(); !usable) {
        return usable;
    }

    std::array<std::uint8_t, MESSAGE_HEADER_SIZE> header_buffer{};
    boost::system::error_code ec = boost::asio::error::would_block;
    boost::asio::async_read(socket_, boost::asio::buffer(header_buffer),
        [&](const boost::system::error_code& result, std::size_t) {
            ec = result;
        });

    bool timed_out = run_for(timeout);
    if (ec || timed_out) {
        return fail(ec, timed_out, core::ErrorCode::STALL_TIMEOUT, "receive header");
    }

    frame.header = MessageHeader::deserialize(header_buffer);
    if (!frame.header.is_valid()) {
        close();
        return core::Result(core::ErrorCode::PROTOCOL_VIOLATION,
                            "Invalid message header from " + remote_address_);
    }

    frame.payload.resize(frame.header.payload_size);
    if (!frame.payload.empty()) {
        ec = boost::asio::error::would_block;
        boost::asio::async_read(socket_, boost::asio::buffer(frame.payload),
            [&](const boost::system::error_code& result, std::size_t) {
                ec = result;
            });

        timed_out = run_for(timeout);
        if (ec || timed_out) {
            return fail(ec, timed_out, core::ErrorCode::STALL_TIMEOUT, "receive payload");
        }
    }

    if (!frame.header.verify_checksum(frame.payload)) {
        close();
        return core::Result(core::ErrorCode::PROTOCOL_VIOLATION,
                            "Checksum mismatch on " + std::string(to_string(frame.header.type)));
    }

    LOG_TRACE("Received {} ({} bytes) from {}", to_string(frame.header.type),
              frame.payload.size(), remote_address_);
    return core::Result();
}

void MessageChannel::cancel() {
    cancelled_ = true;
    boost::asio::post(io_context_, [this]() {
        boost::system::error_code ec;
        socket_.close(ec);
    });
}

void MessageChannel::close() {
    if (socket_.is_open()) {
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }
}

bool MessageChannel::run_for(Duration timeout) {
    io_context_.restart();
    io_context_.run_for(timeout);

    if (!io_context_.stopped()) {
        // Deadline hit: closing the socket completes the pending operation
        // with operation_aborted.
        boost::system::error_code ec;
        socket_.close(ec);
        io_context_.run();
        return true;
    }
    return false;
}

core::Result MessageChannel::check_usable() const {
    if (cancelled_) {
        return core::Result(core::ErrorCode::CANCELLED, "Channel cancelled");
    }
    if (!socket_.is_open()) {
        return core::Result(core::ErrorCode::PEER_DISCONNECTED, "Channel closed");
    }
    return core::Result();
}

core::Result MessageChannel::fail(const boost::system::error_code& ec, bool timed_out,
                                  core::ErrorCode timeout_code, const std::string& what) {
    close();

    if (cancelled_) {
        return core::Result(core::ErrorCode::CANCELLED, what + " cancelled");
    }
    if (timed_out) {
        return core::Result(timeout_code, what + " timed out");
    }
    if (timeout_code == core::ErrorCode::PEER_UNREACHABLE) {
        return core::Result(core::ErrorCode::PEER_UNREACHABLE, what + " failed: " + ec.message());
    }
    // eof, reset, aborted and the like all mean the peer is gone.
    return core::Result(core::ErrorCode::PEER_DISCONNECTED, what + ": " + ec.message());
}

}

#pragma once

#include "lanbeam/core/result.hpp"
#include "lanbeam/network/interfaces.hpp"
#include "lanbeam/network/protocol.hpp"
#include <utility>  // boost 1.74 asio/awaitable.hpp needs std::exchange
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <span>
#include <string>

namespace lanbeam::network {

using boost::asio::ip::tcp;

// Framed TCP connection driven synchronously by its owning thread. Every
// operation runs the channel's private io_context with a deadline; on expiry
// the socket is closed and the call returns STALL_TIMEOUT (PEER_UNREACHABLE
// for connect). cancel() is the only method safe to call from another thread.
class MessageChannel {
public:
    using Duration = std::chrono::milliseconds;

    MessageChannel();

    // Adopts a socket accepted on another io_context.
    explicit MessageChannel(tcp::socket&& accepted);

    ~MessageChannel();

    MessageChannel(const MessageChannel&) = delete;
    MessageChannel& operator=(const MessageChannel&) = delete;

    core::Result connect(const Endpoint& endpoint, Duration timeout);

    core::Result send(MessageType type, std::span<const std::uint8_t> payload, Duration timeout);

    template<MessagePayload T>
    core::Result send_message(MessageType type, const T& message, Duration timeout) {
        auto payload = message.serialize();
        return send(type, payload, timeout);
    }

    // Reads one frame; header, size limit and checksum failures are
    // PROTOCOL_VIOLATION.
    core::Result receive(Frame& frame, Duration timeout);

    void cancel();
    void close();

    bool is_open() const { return socket_.is_open(); }
    bool is_cancelled() const { return cancelled_.load(); }

    // Remote IP, empty before connect.
    const std::string& remote_address() const { return remote_address_; }

private:
    // Returns true when the deadline expired.
    bool run_for(Duration timeout);
    core::Result check_usable() const;
    core::Result fail(const boost::system::error_code& ec, bool timed_out,
                      core::ErrorCode timeout_code, const std::string& what);

    boost::asio::io_context io_context_;
    tcp::socket socket_;
    std::atomic<bool> cancelled_;
    std::string remote_address_;
};

}

#pragma once

#include "lanbeam/core/events.hpp"
#include <chrono>
#include <map>
#include <string>

namespace lanbeam::core {

inline constexpr const char* DEFAULT_IPC_SOCKET = "/tmp/lanbeam.sock";

// Blocks are a header line, key=value lines and "END".
struct IPCRequest {
    std::string command;
    std::map<std::string, std::string> parameters;
};

struct IPCResponse {
    bool success = false;
    std::string message;
    std::map<std::string, std::string> data;

    static IPCResponse ok(std::string message = "OK") {
        return {true, std::move(message), {}};
    }
    static IPCResponse error(std::string message) {
        return {false, std::move(message), {}};
    }
};

struct IPCEvent {
    std::string name;
    std::map<std::string, std::string> fields;
};

std::string format_request(const IPCRequest& request);
std::string format_response(const IPCResponse& response);
std::string format_event(const Event& event);

// Buffered line reader over a connected socket. Lines are capped so a
// misbehaving peer cannot grow the buffer without bound.
class LineReader {
public:
    static constexpr std::size_t MAX_LINE_LENGTH = 64 * 1024;

    explicit LineReader(int fd) : fd_(fd) {}

    // False on EOF, error, receive timeout or an overlong line.
    bool read_line(std::string& line);

private:
    int fd_;
    std::string buffer_;
};

bool read_request(LineReader& reader, IPCRequest& request);
bool read_response(LineReader& reader, IPCResponse& response);
bool read_event(LineReader& reader, IPCEvent& event);

// Writes everything or fails; never raises SIGPIPE.
bool write_all(int fd, const std::string& data);

// SO_RCVTIMEO on the socket; zero disables the timeout.
bool set_receive_timeout(int fd, std::chrono::milliseconds timeout);

}

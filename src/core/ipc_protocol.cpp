#include "lanbeam/core/ipc_protocol.hpp"
#include <sys/socket.h>
#include <sys/time.h>
#include <cerrno>
#include <sstream>

namespace lanbeam::core {

namespace {

// Values are single-line; embedded line breaks would end the block early.
std::string single_line(const std::string& value) {
    std::string result = value;
    for (auto& c : result) {
        if (c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return result;
}

void write_fields(std::ostringstream& out, const std::map<std::string, std::string>& fields) {
    for (const auto& [key, value] : fields) {
        out << key << "=" << single_line(value) << "\n";
    }
}

bool read_fields(LineReader& reader, std::map<std::string, std::string>& fields) {
    std::string line;
    while (reader.read_line(line)) {
        if (line == "END") {
            return true;
        }

        auto eq_pos = line.find('=');
        if (eq_pos != std::string::npos) {
            fields[line.substr(0, eq_pos)] = line.substr(eq_pos + 1);
        }
    }
    return false;
}

}

std::string format_request(const IPCRequest& request) {
    std::ostringstream out;
    out << request.command << "\n";
    write_fields(out, request.parameters);
    out << "END\n";
    return out.str();
}

std::string format_response(const IPCResponse& response) {
    std::ostringstream out;
    out << (response.success ? "SUCCESS" : "ERROR") << "\n";
    out << single_line(response.message) << "\n";
    write_fields(out, response.data);
    out << "END\n";
    return out.str();
}

std::string format_event(const Event& event) {
    std::ostringstream out;
    out << "EVENT " << event_name(event) << "\n";
    for (const auto& [key, value] : event_fields(event)) {
        out << key << "=" << single_line(value) << "\n";
    }
    out << "END\n";
    return out.str();
}

bool LineReader::read_line(std::string& line) {
    while (true) {
        auto newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return true;
        }

        if (buffer_.size() > MAX_LINE_LENGTH) {
            return false;
        }

        char chunk[4096];
        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        buffer_.append(chunk, static_cast<std::size_t>(n));
    }
}

bool read_request(LineReader& reader, IPCRequest& request) {
    std::string line;
    do {
        if (!reader.read_line(line)) {
            return false;
        }
    } while (line.empty());

    request.command = line;
    request.parameters.clear();
    return read_fields(reader, request.parameters);
}

bool read_response(LineReader& reader, IPCResponse& response) {
    std::string status;
    if (!reader.read_line(status) || (status != "SUCCESS" && status != "ERROR")) {
        return false;
    }
    response.success = (status == "SUCCESS");

    if (!reader.read_line(response.message)) {
        return false;
    }
    response.data.clear();
    return read_fields(reader, response.data);
}

bool read_event(LineReader& reader, IPCEvent& event) {
    std::string header;
    if (!reader.read_line(header) || header.rfind("EVENT ", 0) != 0) {
        return false;
    }
    event.name = header.substr(6);
    event.fields.clear();
    return read_fields(reader, event.fields);
}

bool write_all(int fd, const std::string& data) {
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::send(fd, data.data() + written, data.size() - written, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

bool set_receive_timeout(int fd, std::chrono::milliseconds timeout) {
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

}

#include "lanbeam/transfer/transfer_engine.hpp"
#include "lanbeam/core/logger.hpp"
#include "lanbeam/core/utils.hpp"
#include "lanbeam/crypto/hash.hpp"
#include <algorithm>
#include <fstream>

namespace lanbeam::transfer {

namespace {

constexpr std::chrono::milliseconds ABORT_SEND_TIMEOUT{2000};

// Removes a partially written destination unless released.
class PartialFileGuard {
public:
    explicit PartialFileGuard(std::filesystem::path path)
        : path_(std::move(path)), armed_(true) {}

    ~PartialFileGuard() {
        if (armed_) {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
            if (ec) {
                LOG_WARN("Failed to remove partial file {}: {}", path_.string(), ec.message());
            } else {
                LOG_DEBUG("Removed partial file {}", path_.string());
            }
        }
    }

    PartialFileGuard(const PartialFileGuard&) = delete;
    PartialFileGuard& operator=(const PartialFileGuard&) = delete;

    void release() { armed_ = false; }

private:
    std::filesystem::path path_;
    bool armed_;
};

core::Result abort_from_peer(const network::Frame& frame) {
    try {
        auto abort = network::TransferAbortMessage::deserialize(frame.payload);
        auto code = core::error_code_from_wire(abort.error_code);
        return core::Result(code, "Peer aborted: " + abort.message);
    } catch (const std::exception& e) {
        return core::Result(core::ErrorCode::PROTOCOL_VIOLATION,
                            std::string("Malformed abort: ") + e.what());
    }
}

core::Result unexpected(const network::Frame& frame, network::MessageType expected) {
    if (frame.header.type == network::MessageType::TRANSFER_ABORT) {
        return abort_from_peer(frame);
    }
    return core::Result(core::ErrorCode::PROTOCOL_VIOLATION,
                        std::string("Expected ") + network::to_string(expected) +
                        ", got " + network::to_string(frame.header.type));
}

// Codec failures surface as exceptions from deserialize().
template<typename Step>
core::Result run_step(Step&& step) {
    try {
        return step();
    } catch (const std::exception& e) {
        return core::Result(core::ErrorCode::PROTOCOL_VIOLATION, std::string("Malformed message: ") + e.what());
    }
}

// Errors raised on this side; the peer is told about them.
bool is_local_failure(core::ErrorCode code) {
    switch (code) {
        case core::ErrorCode::SOURCE_READ_FAILURE:
        case core::ErrorCode::DESTINATION_WRITE_FAILURE:
        case core::ErrorCode::INTEGRITY_MISMATCH:
        case core::ErrorCode::PROTOCOL_VIOLATION:
        case core::ErrorCode::INTERNAL_ERROR:
            return true;
        default:
            return false;
    }
}

}

TransferEngine::TransferEngine(core::EventBus& events, storage::StorageConfig storage, TransferOptions options)
    : events_(events)
    , storage_(std::move(storage))
    , options_(options) {
    if (options_.chunk_size == 0 || options_.chunk_size > network::MAX_PAYLOAD_SIZE - 64) {
        options_.chunk_size = 65536;
    }
}

core::Result TransferEngine::run_sender(const std::string& offer_id, network::MessageChannel& channel,
                                        std::vector<FileTransfer> files, const SettledCallback& on_settled) {
    TransferSession session(offer_id, TransferRole::SENDER, std::move(files));
    LOG_INFO("Sending {} file(s) ({}) for offer {} to {}", session.files().size(),
             core::utils::StringUtils::format_bytes(session.total_bytes()), offer_id,
             channel.remote_address());

    core::Result result;
    std::uint32_t index = 0;
    while (result && session.has_next()) {
        auto* file = session.begin_next();
        result = run_step([&]() { return send_file(session, *file, index, channel); });
        ++index;
    }

    return finish(session, channel, result, on_settled);
}

core::Result TransferEngine::run_receiver(const std::string& offer_id, network::MessageChannel& channel,
                                          const std::vector<network::OfferedFile>& offered,
                                          const SettledCallback& on_settled) {
    std::vector<FileTransfer> files;
    files.reserve(offered.size());
    for (const auto& entry : offered) {
        FileTransfer file;
        file.name = entry.name;
        file.size = entry.size;
        files.push_back(std::move(file));
    }

    TransferSession session(offer_id, TransferRole::RECEIVER, std::move(files));
    LOG_INFO("Receiving {} file(s) ({}) for offer {} from {}", session.files().size(),
             core::utils::StringUtils::format_bytes(session.total_bytes()), offer_id,
             channel.remote_address());

    core::Result result;
    if (!storage_.has_sufficient_space(session.total_bytes())) {
        result = core::Result(core::ErrorCode::DESTINATION_WRITE_FAILURE,
                              "Not enough space in " + storage_.download_directory.string());
    }

    std::uint32_t index = 0;
    while (result && session.has_next()) {
        auto* file = session.begin_next();
        result = run_step([&]() { return receive_file(session, *file, index, channel); });
        ++index;
    }

    return finish(session, channel, result, on_settled);
}

core::Result TransferEngine::send_file(TransferSession& session, FileTransfer& file, std::uint32_t index,
                                       network::MessageChannel& channel) {
    std::ifstream source(file.local_path, std::ios::binary);
    if (!source.is_open()) {
        return core::Result(core::ErrorCode::SOURCE_READ_FAILURE, "Cannot open " + file.local_path);
    }

    network::FileBeginMessage begin{index, file.name, file.size};
    if (auto sent = channel.send_message(network::MessageType::FILE_BEGIN, begin, options_.stall_timeout); !sent) {
        return sent;
    }

    crypto::ContentHasher hasher;
    ProgressThrottle throttle(options_.progress_interval);

    network::ChunkDataMessage chunk;
    chunk.file_index = index;

    std::uint64_t offset = 0;
    while (offset < file.size) {
        auto length = static_cast<std::size_t>(
            std::min<std::uint64_t>(options_.chunk_size, file.size - offset));
        chunk.offset = offset;
        chunk.data.resize(length);

        source.read(reinterpret_cast<char*>(chunk.data.data()), static_cast<std::streamsize>(length));
        if (static_cast<std::size_t>(source.gcount()) != length) {
            return core::Result(core::ErrorCode::SOURCE_READ_FAILURE,
                                "Short read from " + file.local_path + " at offset " + std::to_string(offset));
        }

        hasher.update(chunk.data);

        if (auto sent = channel.send_message(network::MessageType::CHUNK_DATA, chunk, options_.stall_timeout); !sent) {
            return sent;
        }

        if (auto recorded = session.record_progress(length); !recorded) {
            return recorded;
        }
        offset += length;
        publish_progress(session, file, throttle);
    }

    network::FileEndMessage end{index, hasher.finalize()};
    if (auto sent = channel.send_message(network::MessageType::FILE_END, end, options_.stall_timeout); !sent) {
        return sent;
    }

    network::Frame frame;
    if (auto received = channel.receive(frame, options_.stall_timeout); !received) {
        return received;
    }
    if (frame.header.type != network::MessageType::FILE_ACK) {
        return unexpected(frame, network::MessageType::FILE_ACK);
    }

    auto ack = network::FileAckMessage::deserialize(frame.payload);
    if (ack.file_index != index) {
        return core::Result(core::ErrorCode::PROTOCOL_VIOLATION,
                            "Acknowledgement for file " + std::to_string(ack.file_index) +
                            ", expected " + std::to_string(index));
    }

    if (auto completed = session.complete_current(); !completed) {
        return completed;
    }
    publish_progress(session, file, throttle);
    publish_complete(session, file);

    LOG_INFO("Sent {} ({}), saved by peer as '{}'", file.name,
             core::utils::StringUtils::format_bytes(file.size), ack.saved_name);
    return core::Result();
}

core::Result TransferEngine::receive_file(TransferSession& session, FileTransfer& file, std::uint32_t index,
                                          network::MessageChannel& channel) {
    network::Frame frame;
    if (auto received = channel.receive(frame, options_.stall_timeout); !received) {
        return received;
    }
    if (frame.header.type != network::MessageType::FILE_BEGIN) {
        return unexpected(frame, network::MessageType::FILE_BEGIN);
    }

    auto begin = network::FileBeginMessage::deserialize(frame.payload);
    if (begin.file_index != index || begin.name != file.name || begin.size != file.size) {
        return core::Result(core::ErrorCode::PROTOCOL_VIOLATION,
                            "File " + std::to_string(begin.file_index) + " '" + begin.name +
                            "' does not match offer entry " + std::to_string(index) + " '" + file.name + "'");
    }

    std::filesystem::path destination;
    if (auto reserved = storage_.reserve_destination(file.name, destination); !reserved) {
        return reserved;
    }
    file.local_path = destination.string();

    PartialFileGuard guard(destination);
    std::ofstream output(destination, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        return core::Result(core::ErrorCode::DESTINATION_WRITE_FAILURE, "Cannot open " + destination.string());
    }

    crypto::ContentHasher hasher;
    ProgressThrottle throttle(options_.progress_interval);

    while (file.bytes_transferred < file.size) {
        if (auto received = channel.receive(frame, options_.stall_timeout); !received) {
            return received;
        }
        if (frame.header.type != network::MessageType::CHUNK_DATA) {
            return unexpected(frame, network::MessageType::CHUNK_DATA);
        }

        auto chunk = network::ChunkDataMessage::deserialize(frame.payload);
        if (chunk.file_index != index || chunk.offset != file.bytes_transferred) {
            return core::Result(core::ErrorCode::PROTOCOL_VIOLATION,
                                "Out-of-order chunk for " + file.name + " at offset " + std::to_string(chunk.offset));
        }
        if (auto recorded = session.record_progress(chunk.data.size()); !recorded) {
            return recorded;
        }

        output.write(reinterpret_cast<const char*>(chunk.data.data()),
                     static_cast<std::streamsize>(chunk.data.size()));
        if (!output) {
            return core::Result(core::ErrorCode::DESTINATION_WRITE_FAILURE, "Write failed for " + destination.string());
        }

        hasher.update(chunk.data);
        publish_progress(session, file, throttle);
    }

    if (auto received = channel.receive(frame, options_.stall_timeout); !received) {
        return received;
    }
    if (frame.header.type != network::MessageType::FILE_END) {
        return unexpected(frame, network::MessageType::FILE_END);
    }

    auto end = network::FileEndMessage::deserialize(frame.payload);
    if (end.file_index != index) {
        return core::Result(core::ErrorCode::PROTOCOL_VIOLATION, "FILE_END for wrong file");
    }

    output.close();
    if (output.fail()) {
        return core::Result(core::ErrorCode::DESTINATION_WRITE_FAILURE, "Failed to flush " + destination.string());
    }

    if (hasher.finalize() != end.digest) {
        return core::Result(core::ErrorCode::INTEGRITY_MISMATCH, "Digest mismatch for " + file.name);
    }

    if (auto completed = session.complete_current(); !completed) {
        return completed;
    }
    guard.release();

    publish_progress(session, file, throttle);
    publish_complete(session, file);

    network::FileAckMessage ack{index, destination.filename().string()};
    if (auto sent = channel.send_message(network::MessageType::FILE_ACK, ack, options_.stall_timeout); !sent) {
        return sent;
    }

    LOG_INFO("Received {} ({}) into {}", file.name,
             core::utils::StringUtils::format_bytes(file.size), destination.string());
    return core::Result();
}

core::Result TransferEngine::finish(TransferSession& session, network::MessageChannel& channel, core::Result result,
                                    const SettledCallback& on_settled) {
    if (result) {
        channel.close();
        if (on_settled) {
            on_settled();
        }
        LOG_INFO("Session {} complete ({} file(s), {})", session.offer_id(), session.completed_count(),
                 transfer::to_string(session.role()));
        events_.publish(core::SessionCompletedEvent{session.offer_id(), session.role(), session.completed_count()});
        return result;
    }

    std::optional<std::string> failed_file;
    if (auto* current = session.current(); current && !current->is_terminal()) {
        failed_file = current->name;
    }
    session.fail_remaining(result.error);

    if (is_local_failure(result.error) && channel.is_open() && !channel.is_cancelled()) {
        network::TransferAbortMessage abort{static_cast<std::uint32_t>(result.error), result.message};
        auto sent = channel.send_message(network::MessageType::TRANSFER_ABORT, abort,
                                         std::min(ABORT_SEND_TIMEOUT, options_.stall_timeout));
        if (!sent) {
            LOG_DEBUG("Could not deliver abort for {}: {}", session.offer_id(), sent.describe());
        }
    }
    channel.close();
    if (on_settled) {
        on_settled();
    }

    LOG_ERROR("Session {} failed ({}): {}", session.offer_id(),
              transfer::to_string(session.role()), result.describe());
    events_.publish(core::SessionFailedEvent{session.offer_id(), session.role(), result.error,
                                             result.message, failed_file});
    return result;
}

void TransferEngine::publish_progress(const TransferSession& session, const FileTransfer& file,
                                      ProgressThrottle& throttle) {
    auto value = throttle.update(file.percentage());
    if (!value) {
        return;
    }

    core::TransferProgressEvent event;
    event.offer_id = session.offer_id();
    if (session.role() == TransferRole::SENDER) {
        event.file_path = file.local_path;
    } else {
        event.file_name = file.name;
    }
    event.progress = *value;
    events_.publish(event);
}

void TransferEngine::publish_complete(const TransferSession& session, const FileTransfer& file) {
    core::TransferCompleteEvent event;
    event.offer_id = session.offer_id();
    if (session.role() == TransferRole::SENDER) {
        event.file_path = file.local_path;
    } else {
        event.file_name = file.name;
        event.saved_path = file.local_path;
    }
    events_.publish(event);
}

}

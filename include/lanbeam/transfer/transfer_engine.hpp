#pragma once

#include "lanbeam/core/event_bus.hpp"
#include "lanbeam/core/result.hpp"
#include "lanbeam/network/message_channel.hpp"
#include "lanbeam/storage/storage_config.hpp"
#include "lanbeam/transfer/progress_throttle.hpp"
#include "lanbeam/transfer/transfer_session.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace lanbeam::transfer {

struct TransferOptions {
    std::size_t chunk_size = 65536;
    std::chrono::milliseconds stall_timeout{15000};
    std::chrono::milliseconds progress_interval{100};
};

// Runs one accepted offer over its channel, file by file in offer order.
class TransferEngine {
public:
    TransferEngine(core::EventBus& events, storage::StorageConfig storage, TransferOptions options);

    // Called once the session is over, before session-complete / session-failed goes out.
    using SettledCallback = std::function<void()>;

    core::Result run_sender(const std::string& offer_id, network::MessageChannel& channel,
                            std::vector<FileTransfer> files, const SettledCallback& on_settled = {});

    core::Result run_receiver(const std::string& offer_id, network::MessageChannel& channel,
                              const std::vector<network::OfferedFile>& files,
                              const SettledCallback& on_settled = {});

    const TransferOptions& options() const { return options_; }
    const storage::StorageConfig& storage() const { return storage_; }

private:
    core::Result send_file(TransferSession& session, FileTransfer& file, std::uint32_t index,
                           network::MessageChannel& channel);
    core::Result receive_file(TransferSession& session, FileTransfer& file, std::uint32_t index,
                              network::MessageChannel& channel);

    core::Result finish(TransferSession& session, network::MessageChannel& channel, core::Result result,
                        const SettledCallback& on_settled);

    void publish_progress(const TransferSession& session, const FileTransfer& file,
                          ProgressThrottle& throttle);
    void publish_complete(const TransferSession& session, const FileTransfer& file);

    core::EventBus& events_;
    storage::StorageConfig storage_;
    TransferOptions options_;
};

}

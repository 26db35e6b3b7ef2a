#pragma once

#include "lanbeam/core/result.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanbeam::transfer {

enum class TransferRole {
    SENDER,
    RECEIVER
};

enum class FileTransferStatus {
    PENDING,
    IN_PROGRESS,
    COMPLETED,
    FAILED
};

const char* to_string(TransferRole role);
const char* to_string(FileTransferStatus status);

struct FileTransfer {
    std::string name;
    std::uint64_t size = 0;
    std::uint64_t bytes_transferred = 0;
    FileTransferStatus status = FileTransferStatus::PENDING;

    // Source path on the sender, saved path on the receiver.
    std::string local_path;
    core::ErrorCode error = core::ErrorCode::SUCCESS;

    // floor(bytes * 100 / size); 100 for an empty file.
    std::uint32_t percentage() const;
    bool is_terminal() const;
};

// Files of one accepted offer, advanced strictly in offer order.
class TransferSession {
public:
    TransferSession(std::string offer_id, TransferRole role, std::vector<FileTransfer> files);

    bool has_next() const;

    // Moves the cursor to the next pending file and marks it IN_PROGRESS.
    // Returns nullptr when no file is left or the current one is unfinished.
    FileTransfer* begin_next();

    FileTransfer* current();
    std::optional<std::size_t> current_index() const { return current_; }

    // Adds `bytes` to the current file. Fails if no file is in progress or
    // the total would exceed the declared size.
    core::Result record_progress(std::uint64_t bytes);

    core::Result complete_current();
    void fail_current(core::ErrorCode error);

    // Fails the current file and every file not yet started.
    void fail_remaining(core::ErrorCode error);

    bool is_finished() const;
    bool succeeded() const;
    std::size_t completed_count() const;

    const std::string& offer_id() const { return offer_id_; }
    TransferRole role() const { return role_; }
    const std::vector<FileTransfer>& files() const { return files_; }
    std::uint64_t total_bytes() const;
    std::uint64_t bytes_transferred() const;

private:
    std::string offer_id_;
    TransferRole role_;
    std::vector<FileTransfer> files_;
    std::optional<std::size_t> current_;
    std::size_t next_;
};

}

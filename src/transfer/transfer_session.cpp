#include "lanbeam/transfer/transfer_session.hpp"
#include <algorithm>
#include <cstdint>

namespace lanbeam::transfer {

const char* to_string(TransferRole role) {
    switch (role) {
        case TransferRole::SENDER:   return "sender";
        case TransferRole::RECEIVER: return "receiver";
    }
    return "unknown";
}

const char* to_string(FileTransferStatus status) {
    switch (status) {
        case FileTransferStatus::PENDING:     return "pending";
        case FileTransferStatus::IN_PROGRESS: return "in_progress";
        case FileTransferStatus::COMPLETED:   return "completed";
        case FileTransferStatus::FAILED:      return "failed";
    }
    return "unknown";
}

std::uint32_t FileTransfer::percentage() const {
    if (size == 0) {
        return 100;
    }
    auto bytes = std::min(bytes_transferred, size);
    // Split to keep bytes * 100 from overflowing on very large files.
    auto whole = (bytes / size) * 100;
    auto remainder = bytes % size;
    std::uint64_t rest = remainder <= UINT64_MAX / 100
        ? (remainder * 100) / size
        : static_cast<std::uint64_t>((static_cast<long double>(remainder) * 100) / size);
    return static_cast<std::uint32_t>(whole + rest);
}

bool FileTransfer::is_terminal() const {
    return status == FileTransferStatus::COMPLETED || status == FileTransferStatus::FAILED;
}

TransferSession::TransferSession(std::string offer_id, TransferRole role, std::vector<FileTransfer> files)
    : offer_id_(std::move(offer_id))
    , role_(role)
    , files_(std::move(files))
    , current_(std::nullopt)
    , next_(0) {
}

bool TransferSession::has_next() const {
    return next_ < files_.size() && files_[next_].status == FileTransferStatus::PENDING;
}

FileTransfer* TransferSession::begin_next() {
    if (current_ && files_[*current_].status == FileTransferStatus::IN_PROGRESS) {
        return nullptr;
    }
    if (!has_next()) {
        return nullptr;
    }

    current_ = next_++;
    auto& file = files_[*current_];
    file.status = FileTransferStatus::IN_PROGRESS;
    return &file;
}

FileTransfer* TransferSession::current() {
    if (!current_) {
        return nullptr;
    }
    return &files_[*current_];
}

core::Result TransferSession::record_progress(std::uint64_t bytes) {
    auto* file = current();
    if (!file || file->status != FileTransferStatus::IN_PROGRESS) {
        return core::Result(core::ErrorCode::INVALID_STATE, "No file in progress");
    }
    if (bytes > file->size - file->bytes_transferred) {
        return core::Result(core::ErrorCode::PROTOCOL_VIOLATION,
                            "Data exceeds declared size of " + file->name);
    }
    file->bytes_transferred += bytes;
    return core::Result();
}

core::Result TransferSession::complete_current() {
    auto* file = current();
    if (!file || file->status != FileTransferStatus::IN_PROGRESS) {
        return core::Result(core::ErrorCode::INVALID_STATE, "No file in progress");
    }
    if (file->bytes_transferred != file->size) {
        return core::Result(core::ErrorCode::INTEGRITY_MISMATCH,
                            "Size mismatch for " + file->name + ": expected " +
                            std::to_string(file->size) + " bytes, got " +
                            std::to_string(file->bytes_transferred));
    }
    file->status = FileTransferStatus::COMPLETED;
    return core::Result();
}

void TransferSession::fail_current(core::ErrorCode error) {
    auto* file = current();
    if (file && file->status == FileTransferStatus::IN_PROGRESS) {
        file->status = FileTransferStatus::FAILED;
        file->error = error;
    }
}

void TransferSession::fail_remaining(core::ErrorCode error) {
    fail_current(error);
    for (; next_ < files_.size(); ++next_) {
        if (files_[next_].status == FileTransferStatus::PENDING) {
            files_[next_].status = FileTransferStatus::FAILED;
            files_[next_].error = error;
        }
    }
}

bool TransferSession::is_finished() const {
    return std::all_of(files_.begin(), files_.end(),
                       [](const FileTransfer& f) { return f.is_terminal(); });
}

bool TransferSession::succeeded() const {
    return std::all_of(files_.begin(), files_.end(),
                       [](const FileTransfer& f) { return f.status == FileTransferStatus::COMPLETED; });
}

std::size_t TransferSession::completed_count() const {
    return static_cast<std::size_t>(std::count_if(files_.begin(), files_.end(),
        [](const FileTransfer& f) { return f.status == FileTransferStatus::COMPLETED; }));
}

std::uint64_t TransferSession::total_bytes() const {
    std::uint64_t total = 0;
    for (const auto& file : files_) {
        total += file.size;
    }
    return total;
}

std::uint64_t TransferSession::bytes_transferred() const {
    std::uint64_t total = 0;
    for (const auto& file : files_) {
        total += file.bytes_transferred;
    }
    return total;
}

}

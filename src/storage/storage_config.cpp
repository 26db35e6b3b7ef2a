#include "lanbeam/storage/storage_config.hpp"
#include "lanbeam/core/utils.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace lanbeam::storage {

namespace {
constexpr int MAX_NAME_ATTEMPTS = 10000;
}

StorageConfig::StorageConfig(const std::filesystem::path& download_dir)
    : download_directory(download_dir) {
}

bool StorageConfig::validate() const {
    return !download_directory.empty();
}

bool StorageConfig::create_directories() const {
    return core::utils::FileUtils::create_directories(download_directory);
}

uint64_t StorageConfig::get_available_space() const {
    std::error_code ec;
    auto space_info = std::filesystem::space(download_directory, ec);
    if (ec) {
        return 0;
    }
    return space_info.available;
}

bool StorageConfig::has_sufficient_space(uint64_t required_bytes) const {
    std::error_code ec;
    auto space_info = std::filesystem::space(download_directory, ec);
    if (ec) {
        return true;
    }
    return space_info.available >= required_bytes;
}

core::Result StorageConfig::reserve_destination(const std::string& file_name,
                                                std::filesystem::path& destination) const {
    auto safe_name = core::utils::FileUtils::sanitize_file_name(file_name);
    if (!safe_name) {
        return core::Result(core::ErrorCode::PROTOCOL_VIOLATION,
                            "Unusable file name '" + file_name + "'");
    }

    if (!create_directories()) {
        return core::Result(core::ErrorCode::DESTINATION_WRITE_FAILURE,
                            "Cannot create " + download_directory.string());
    }

    std::filesystem::path base(*safe_name);
    auto stem = base.stem().string();
    auto extension = base.extension().string();

    for (int attempt = 0; attempt < MAX_NAME_ATTEMPTS; ++attempt) {
        auto candidate = attempt == 0
            ? download_directory / base
            : download_directory / (stem + " (" + std::to_string(attempt) + ")" + extension);

        int fd = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
        if (fd >= 0) {
            ::close(fd);
            destination = candidate;
            return core::Result();
        }
        if (errno != EEXIST) {
            return core::Result(core::ErrorCode::DESTINATION_WRITE_FAILURE,
                                "Cannot create " + candidate.string() + ": " + std::strerror(errno));
        }
    }

    return core::Result(core::ErrorCode::DESTINATION_WRITE_FAILURE,
                        "No free name for " + *safe_name + " in " + download_directory.string());
}

} // namespace lanbeam::storage

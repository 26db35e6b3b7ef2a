#pragma once

#include "lanbeam/core/result.hpp"
#include <filesystem>
#include <string>
#include <cstdint>

namespace lanbeam::storage {

struct StorageConfig {
    std::filesystem::path download_directory;

    StorageConfig() = default;

    explicit StorageConfig(const std::filesystem::path& download_dir);

    bool validate() const;

    bool create_directories() const;

    // 0 when the file system cannot be queried.
    uint64_t get_available_space() const;

    // True when the space is unknown; false only for a definite shortfall.
    bool has_sufficient_space(uint64_t required_bytes) const;

    // Creates an empty file for `file_name` in the download directory and
    // returns its path: "name.ext", then "name (1).ext", "name (2).ext", ...
    // The name is reduced to its last path component first.
    core::Result reserve_destination(const std::string& file_name,
                                     std::filesystem::path& destination) const;
};

} // namespace lanbeam::storage

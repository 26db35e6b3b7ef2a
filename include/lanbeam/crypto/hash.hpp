#pragma once

#include "lanbeam/core/result.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace lanbeam::crypto {

constexpr std::size_t CONTENT_DIGEST_SIZE = 32;

using ContentDigest = std::array<std::uint8_t, CONTENT_DIGEST_SIZE>;

// Streaming BLAKE2b digest over file content.
class ContentHasher {
public:
    ContentHasher();
    ~ContentHasher();

    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;

    void update(std::span<const std::uint8_t> data);

    // Consumes the hasher; a second call throws.
    ContentDigest finalize();

    static ContentDigest hash(std::span<const std::uint8_t> data);
    static core::Result hash_file(const std::filesystem::path& file_path, ContentDigest& output);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool finalized_;
};

std::string digest_to_hex(const ContentDigest& digest);

}

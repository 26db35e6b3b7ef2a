#include "lanbeam/crypto/hash.hpp"
#include "lanbeam/crypto/random.hpp"
#include "lanbeam/core/utils.hpp"
#include <sodium.h>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace lanbeam::crypto {

struct ContentHasher::Impl {
    crypto_generichash_state state;
};

ContentHasher::ContentHasher()
    : impl_(std::make_unique<Impl>())
    , finalized_(false) {
    if (!SecureRandom::initialize() ||
        crypto_generichash_init(&impl_->state, nullptr, 0, CONTENT_DIGEST_SIZE) != 0) {
        throw std::runtime_error("Failed to initialize content hasher");
    }
}

ContentHasher::~ContentHasher() = default;

void ContentHasher::update(std::span<const std::uint8_t> data) {
    if (finalized_) {
        throw std::logic_error("Content hasher already finalized");
    }
    if (data.empty()) {
        return;
    }
    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        throw std::runtime_error("Failed to update content digest");
    }
}

ContentDigest ContentHasher::finalize() {
    if (finalized_) {
        throw std::logic_error("Content hasher already finalized");
    }

    ContentDigest result;
    if (crypto_generichash_final(&impl_->state, result.data(), result.size()) != 0) {
        throw std::runtime_error("Failed to finalize content digest");
    }
    finalized_ = true;
    return result;
}

ContentDigest ContentHasher::hash(std::span<const std::uint8_t> data) {
    ContentHasher hasher;
    hasher.update(data);
    return hasher.finalize();
}

core::Result ContentHasher::hash_file(const std::filesystem::path& file_path, ContentDigest& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return core::Result(core::ErrorCode::SOURCE_READ_FAILURE, "Cannot open file for hashing: " + file_path.string());
    }

    ContentHasher hasher;

    constexpr std::size_t buffer_size = 65536;
    std::vector<std::uint8_t> buffer(buffer_size);

    while (file.good()) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        auto bytes_read = static_cast<std::size_t>(file.gcount());

        if (bytes_read > 0) {
            hasher.update(std::span(buffer.data(), bytes_read));
        }
    }

    if (file.bad()) {
        return core::Result(core::ErrorCode::SOURCE_READ_FAILURE, "Read error while hashing: " + file_path.string());
    }

    output = hasher.finalize();
    return core::Result();
}

std::string digest_to_hex(const ContentDigest& digest) {
    return core::utils::StringUtils::to_hex(digest.data(), digest.size());
}

}

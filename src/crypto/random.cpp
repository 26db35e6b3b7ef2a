#include "lanbeam/crypto/random.hpp"
#include "lanbeam/core/logger.hpp"
#include "lanbeam/core/utils.hpp"
#include <sodium.h>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace lanbeam::crypto {

namespace {
std::once_flag init_flag;
bool init_ok = false;
}

bool SecureRandom::initialize() {
    std::call_once(init_flag, [] {
        if (sodium_init() < 0) {
            LOG_ERROR("Failed to initialize libsodium");
            return;
        }
        init_ok = true;
        LOG_DEBUG("Cryptographic random number generator initialized");
    });
    return init_ok;
}

void SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialize()) {
        throw std::runtime_error("Random generator not available");
    }
    if (output.empty()) {
        return;
    }
    randombytes_buf(output.data(), output.size());
}

std::uint32_t SecureRandom::generate_uint32() {
    if (!initialize()) {
        throw std::runtime_error("Random generator not available");
    }
    return randombytes_random();
}

std::uint64_t SecureRandom::generate_uint64() {
    std::uint64_t high = generate_uint32();
    std::uint64_t low = generate_uint32();
    return (high << 32) | low;
}

std::string SecureRandom::generate_hex(std::size_t byte_count) {
    std::vector<std::uint8_t> bytes(byte_count);
    generate_bytes(std::span(bytes));
    return core::utils::StringUtils::to_hex(bytes.data(), bytes.size());
}

}

#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace lanbeam::crypto {

// libsodium-backed CSPRNG. initialize() is idempotent and thread-safe.
class SecureRandom {
public:
    static bool initialize();

    static void generate_bytes(std::span<std::uint8_t> output);
    static std::uint32_t generate_uint32();
    static std::uint64_t generate_uint64();

    // Lower-case hex string built from `byte_count` random bytes.
    static std::string generate_hex(std::size_t byte_count);
};

}

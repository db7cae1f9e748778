/**
 * FileDrop - Hashing and randomness helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <span>
#include <string>

#include <sodium.h>

namespace filedrop::crypto
{

    void ensure_sodium_init();

    // Incremental SHA-256; digests are reported as lowercase hex.
    class Sha256
    {
    public:
        Sha256();

        void update(std::span<const std::byte> data);
        std::string final_hex();

    private:
        crypto_hash_sha256_state state_{};
        bool finished_{false};
    };

    std::string sha256_bytes(std::span<const std::byte> data);

    std::string sha256_stream(std::istream &input);

    std::string sha256_file(const std::filesystem::path &path);

    // Hex string built from byte_count random bytes.
    std::string random_hex(std::size_t byte_count);

} // namespace filedrop::crypto

#include "filedrop/crypto.hpp"

#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace filedrop::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::string to_hex(std::span<const unsigned char> data)
        {
            std::string result(data.size() * 2 + 1, '\0');
            sodium_bin2hex(result.data(), result.size(), data.data(), data.size());
            result.resize(data.size() * 2);
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

    } // namespace

    void ensure_sodium_init()
    {
        std::call_once(sodium_once_flag(), []()
                       { throw_if_sodium_init_failed(sodium_init()); });
    }

    Sha256::Sha256()
    {
        ensure_sodium_init();
        if (crypto_hash_sha256_init(&state_) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_init failed");
        }
    }

    void Sha256::update(std::span<const std::byte> data)
    {
        if (finished_)
        {
            throw std::logic_error("Sha256::update called after final_hex");
        }
        if (crypto_hash_sha256_update(&state_, reinterpret_cast<const unsigned char *>(data.data()),
                                      data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_update failed");
        }
    }

    std::string Sha256::final_hex()
    {
        if (finished_)
        {
            throw std::logic_error("Sha256::final_hex called twice");
        }
        std::vector<unsigned char> digest(crypto_hash_sha256_BYTES);
        if (crypto_hash_sha256_final(&state_, digest.data()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_final failed");
        }
        finished_ = true;
        return to_hex(digest);
    }

    std::string sha256_bytes(std::span<const std::byte> data)
    {
        Sha256 hasher;
        hasher.update(data);
        return hasher.final_hex();
    }

    std::string sha256_stream(std::istream &input)
    {
        Sha256 hasher;
        std::vector<std::byte> buffer(64 * 1024);
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                hasher.update(std::span<const std::byte>(buffer.data(), read_count));
            }
        }
        return hasher.final_hex();
    }

    std::string sha256_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return sha256_stream(file);
    }

    std::string random_hex(std::size_t byte_count)
    {
        ensure_sodium_init();
        std::vector<unsigned char> bytes(byte_count);
        randombytes_buf(bytes.data(), bytes.size());
        return to_hex(bytes);
    }

} // namespace filedrop::crypto

#include "stowage/crypto.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace stowage::crypto
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
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    struct Sha256::State
    {
        crypto_hash_sha256_state state;
    };

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    Sha256::Sha256()
        : state_(std::make_unique<State>())
    {
        ensure_initialized_once();
        if (crypto_hash_sha256_init(&state_->state) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_init failed");
        }
    }

    Sha256::~Sha256() = default;

    void Sha256::update(std::span<const std::byte> data)
    {
        if (data.empty())
        {
            return;
        }
        if (crypto_hash_sha256_update(&state_->state, reinterpret_cast<const unsigned char *>(data.data()),
                                      data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_update failed");
        }
    }

    std::string Sha256::finish_hex()
    {
        std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
        if (crypto_hash_sha256_final(&state_->state, digest.data()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_final failed");
        }
        return to_hex(digest);
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        Sha256 hasher;
        hasher.update(data);
        return hasher.finish_hex();
    }

    std::string hash_stream(std::istream &input)
    {
        Sha256 hasher;
        std::vector<char> buffer(1024 * 1024);
        while (input)
        {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                hasher.update(std::as_bytes(std::span(buffer.data(), read_count)));
            }
        }
        if (input.bad())
        {
            throw std::runtime_error("Read failed while hashing");
        }
        return hasher.finish_hex();
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file);
    }

    std::string generate_upload_id()
    {
        ensure_initialized_once();
        std::array<unsigned char, 16> bytes{};
        randombytes_buf(bytes.data(), bytes.size());

        const auto millis = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count());
        for (int i = 0; i < 6; ++i)
        {
            bytes[static_cast<std::size_t>(i)] = static_cast<unsigned char>((millis >> (40 - 8 * i)) & 0xFF);
        }
        bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x70);
        bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

        const auto hex = to_hex(bytes);
        return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" +
               hex.substr(20, 12);
    }

} // namespace stowage::crypto

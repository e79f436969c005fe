/**
 * Stowage - Hashing and identifier helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <span>
#include <string>

namespace stowage::crypto
{

    void ensure_sodium_init();

    // Incremental SHA-256, hex encoded on finish.
    class Sha256
    {
    public:
        Sha256();
        ~Sha256();

        Sha256(const Sha256 &) = delete;
        Sha256 &operator=(const Sha256 &) = delete;

        void update(std::span<const std::byte> data);
        std::string finish_hex();

    private:
        struct State;
        std::unique_ptr<State> state_;
    };

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    // UUIDv7: 48-bit millisecond timestamp followed by random bits, so that
    // lexical order follows creation order.
    std::string generate_upload_id();

} // namespace stowage::crypto

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace stowage::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path database_path;
        std::filesystem::path storage_root;
        std::optional<std::string> public_url;
        std::size_t worker_threads{0};
        std::size_t pool_size{4};
        std::uint64_t max_chunk_bytes{64ULL * 1024 * 1024};
        std::chrono::seconds upload_timeout{std::chrono::hours{24}};
        std::chrono::seconds sweep_interval{std::chrono::minutes{5}};
        std::chrono::milliseconds idle_timeout{std::chrono::seconds{120}};
        std::optional<std::filesystem::path> log_file;
        bool verbose{false};
    };

} // namespace stowage::server

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stowage::client
{

    struct ClientConfig
    {
        std::filesystem::path file;
        std::vector<std::string> items;
        std::string project;
        std::string pipeline;
        std::string uploader;
        std::string base_url;
        std::uint64_t chunk_size{16ULL * 1024 * 1024};
        std::size_t attempts{5};
        std::optional<std::filesystem::path> log_path;
    };

    std::string usage(const std::string &program_name);

    // Throws std::runtime_error describing the first problem found.
    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace stowage::client

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "stowage/server/server.hpp"
#include "stowage/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "Stowage upload server " << stowage::version() << "\n"
                  << "Usage: " << program_name
                  << " --port <PORT> --database <FILE> --storage <DIR> [--address <ADDRESS>] [--public-url <URL>]\n"
                     "       [--threads <N>] [--pool-size <N>] [--max-chunk <BYTES>] [--upload-timeout <seconds>]\n"
                     "       [--idle-timeout <seconds>] [--log <FILE>] [--verbose]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

} // namespace

int main(int argc, char *argv[])
{
    using stowage::server::Server;
    using stowage::server::ServerConfig;

    ServerConfig config;
    bool port_given = false;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }
            if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
                continue;
            }

            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }

            if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(std::stoi(*value));
                port_given = true;
            }
            else if (arg == "--database")
            {
                config.database_path = std::filesystem::path(*value);
            }
            else if (arg == "--storage")
            {
                config.storage_root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--public-url")
            {
                config.public_url = *value;
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--pool-size")
            {
                config.pool_size = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--max-chunk")
            {
                config.max_chunk_bytes = std::stoull(*value);
            }
            else if (arg == "--upload-timeout")
            {
                config.upload_timeout = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--idle-timeout")
            {
                config.idle_timeout = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
            else
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
        }
    }
    catch (const std::logic_error &ex)
    {
        // std::stoi and friends throw invalid_argument / out_of_range.
        std::cerr << "Invalid numeric option: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (!port_given || config.database_path.empty() || config.storage_root.empty() || config.pool_size == 0)
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), false));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting stowage server {} on {}:{}", stowage::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

#include "stowage/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace stowage::client
{

    namespace
    {

        std::string take_value(int &index, int argc, char *argv[], const std::string &option)
        {
            if (index >= argc)
            {
                throw std::runtime_error(option + " requires a value");
            }
            return argv[index++];
        }

        std::uint64_t parse_positive(const std::string &value, const std::string &option)
        {
            std::size_t consumed = 0;
            std::uint64_t parsed = 0;
            try
            {
                parsed = std::stoull(value, &consumed);
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error(option + " expects a positive integer, got '" + value + "'");
            }
            if (consumed != value.size() || parsed == 0 || value.front() == '-')
            {
                throw std::runtime_error(option + " expects a positive integer, got '" + value + "'");
            }
            return parsed;
        }

    } // namespace

    std::string usage(const std::string &program_name)
    {
        return "Usage: " + program_name +
               " <file> <item>... --project <P> --pipeline <P> --uploader <U> --base-url <URL>"
               " [--chunk-size <BYTES>] [--attempts <N>] [--log <FILE>]";
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        const std::string program = argc > 0 ? argv[0] : "stowage-upload";
        ClientConfig config;
        std::vector<std::string> positional;

        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--project")
            {
                config.project = take_value(index, argc, argv, arg);
            }
            else if (arg == "--pipeline")
            {
                config.pipeline = take_value(index, argc, argv, arg);
            }
            else if (arg == "--uploader")
            {
                config.uploader = take_value(index, argc, argv, arg);
            }
            else if (arg == "--base-url")
            {
                config.base_url = take_value(index, argc, argv, arg);
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = parse_positive(take_value(index, argc, argv, arg), arg);
            }
            else if (arg == "--attempts")
            {
                config.attempts = static_cast<std::size_t>(parse_positive(take_value(index, argc, argv, arg), arg));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(take_value(index, argc, argv, arg));
            }
            else if (arg.starts_with("--"))
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                positional.push_back(arg);
            }
        }

        if (positional.size() < 2)
        {
            throw std::runtime_error("Expected a file and at least one item\n" + usage(program));
        }
        config.file = std::filesystem::path(positional.front());
        config.items.assign(positional.begin() + 1, positional.end());

        if (config.project.empty() || config.pipeline.empty() || config.uploader.empty() || config.base_url.empty())
        {
            throw std::runtime_error("--project, --pipeline, --uploader and --base-url are required\n" +
                                     usage(program));
        }
        return config;
    }

} // namespace stowage::client

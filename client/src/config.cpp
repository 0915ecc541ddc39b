#include "ferry/client/config.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "ferry/framing.hpp"

namespace ferry::client
{

    namespace
    {
        constexpr auto kUsage =
            "Usage: client [username@]<server>:<port> [--source <dir>] [--file <path>]... [--token <token>] "
            "[--chunk-size <bytes>] [--framing tagged|boundary] [--boundary <text>] [--timeout <seconds>] [--log <file>]";

        // Tagged framing adds one byte to every content frame.
        constexpr std::size_t kMaxChunkSize = ferry::protocol::kDefaultMaxFramePayload - 1;

        std::string require_value(int &index, int argc, char *argv[], const std::string &option)
        {
            if (index >= argc)
            {
                throw std::runtime_error(option + " requires a value");
            }
            return argv[index++];
        }
    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error(kUsage);
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto at_pos = endpoint.find('@');
        std::string host_part = endpoint;
        if (at_pos != std::string::npos)
        {
            config.username = endpoint.substr(0, at_pos);
            host_part = endpoint.substr(at_pos + 1);
        }

        const auto colon_pos = host_part.rfind(':');
        if (colon_pos == std::string::npos)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = host_part.substr(0, colon_pos);
        const auto port_string = host_part.substr(colon_pos + 1);
        config.port = static_cast<std::uint16_t>(std::stoi(port_string));

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--source")
            {
                config.source_dir = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--file")
            {
                config.files.emplace_back(require_value(index, argc, argv, arg));
            }
            else if (arg == "--token")
            {
                config.token = require_value(index, argc, argv, arg);
                if (config.token.empty())
                {
                    throw std::runtime_error("--token cannot be empty");
                }
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = static_cast<std::size_t>(std::stoull(require_value(index, argc, argv, arg)));
                if (config.chunk_size == 0 || config.chunk_size > kMaxChunkSize)
                {
                    throw std::runtime_error("--chunk-size must be between 1 and " + std::to_string(kMaxChunkSize));
                }
            }
            else if (arg == "--framing")
            {
                const auto value = require_value(index, argc, argv, arg);
                const auto mode = ferry::protocol::framing_mode_from_string(value);
                if (!mode)
                {
                    throw std::runtime_error("Unknown framing mode: " + value);
                }
                config.framing = *mode;
            }
            else if (arg == "--boundary")
            {
                config.boundary = require_value(index, argc, argv, arg);
                if (config.boundary->empty())
                {
                    throw std::runtime_error("--boundary cannot be empty");
                }
            }
            else if (arg == "--timeout")
            {
                config.timeout = std::chrono::seconds(std::stoll(require_value(index, argc, argv, arg)));
                if (config.timeout <= std::chrono::seconds::zero())
                {
                    throw std::runtime_error("--timeout must be positive");
                }
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (config.username.empty())
        {
            throw std::runtime_error("Username cannot be empty");
        }
        if (config.source_dir && !config.files.empty())
        {
            throw std::runtime_error("--source and --file are mutually exclusive");
        }
        if (!config.source_dir && config.files.empty())
        {
            config.source_dir = std::filesystem::path("assets");
        }
        return config;
    }

} // namespace ferry::client

#include "treasury/server/config.hpp"

#include <fstream>
#include <limits>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

namespace treasury::server
{

    namespace
    {

        std::uint64_t parse_unsigned(std::string_view flag, const std::string &value)
        {
            try
            {
                std::size_t consumed = 0;
                const auto parsed = std::stoull(value, &consumed);
                if (consumed != value.size() || value.front() == '-')
                {
                    throw std::invalid_argument(value);
                }
                return parsed;
            }
            catch (const std::exception &)
            {
                throw ConfigError("Invalid value for " + std::string(flag) + ": " + value);
            }
        }

        std::uint16_t parse_port(std::string_view flag, const std::string &value)
        {
            const auto port = parse_unsigned(flag, value);
            if (port > std::numeric_limits<std::uint16_t>::max())
            {
                throw ConfigError("Port out of range: " + value);
            }
            return static_cast<std::uint16_t>(port);
        }

        template <typename Duration>
        Duration to_timeout(std::string_view name, std::uint64_t count)
        {
            const auto limit = std::chrono::duration_cast<Duration>(kMaxTimeout).count();
            if (count > static_cast<std::uint64_t>(limit))
            {
                throw ConfigError(std::string(name) + " exceeds the one year maximum: " + std::to_string(count));
            }
            return Duration{static_cast<typename Duration::rep>(count)};
        }

        const std::string &require_value(int &index, int argc, const char *const argv[], std::string &storage)
        {
            if (index + 1 >= argc)
            {
                throw ConfigError(std::string("Missing value for ") + argv[index]);
            }
            ++index;
            storage = argv[index];
            return storage;
        }

    } // namespace

    void apply_config_json(ServerConfig &config, const nlohmann::json &json)
    {
        if (!json.is_object())
        {
            throw ConfigError("Configuration must be a JSON object");
        }
        try
        {
            config.address = json.value("address", config.address);
            if (json.contains("port"))
            {
                const auto port = json.at("port").get<std::uint64_t>();
                if (port > std::numeric_limits<std::uint16_t>::max())
                {
                    throw ConfigError("Port out of range: " + std::to_string(port));
                }
                config.port = static_cast<std::uint16_t>(port);
            }
            if (json.contains("root"))
            {
                config.root = json.at("root").get<std::string>();
            }
            config.worker_threads = json.value("threads", config.worker_threads);
            config.max_pending_chunks = json.value("max_pending_chunks", config.max_pending_chunks);
            if (json.contains("download_idle_ms"))
            {
                config.download_idle_timeout =
                    to_timeout<std::chrono::milliseconds>("download_idle_ms", json.at("download_idle_ms").get<std::uint64_t>());
            }
            if (json.contains("upload_timeout_seconds"))
            {
                config.upload_timeout = to_timeout<std::chrono::seconds>("upload_timeout_seconds",
                                                                json.at("upload_timeout_seconds").get<std::uint64_t>());
            }
            config.max_frame_size = json.value("max_frame_size", config.max_frame_size);
            if (json.contains("log_file"))
            {
                config.log_file = std::filesystem::path(json.at("log_file").get<std::string>());
            }
            config.log_level = json.value("log_level", config.log_level);
            if (json.contains("access_tokens"))
            {
                config.access_tokens.clear();
                for (const auto &entry : json.at("access_tokens"))
                {
                    config.access_tokens.push_back(AccessTokenEntry{
                        .token = entry.at("token").get<std::string>(),
                        .user_id = entry.at("user_id").get<UserId>(),
                    });
                }
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ConfigError(std::string("Invalid configuration: ") + ex.what());
        }
    }

    void load_config_file(ServerConfig &config, const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw ConfigError("Failed to open configuration file: " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw ConfigError("Failed to parse " + path.string() + ": " + ex.what());
        }
        apply_config_json(config, json);
    }

    CommandLine parse_arguments(int argc, const char *const argv[])
    {
        CommandLine result;
        auto &config = result.config;
        std::string value;

        for (int i = 1; i < argc; ++i)
        {
            if (std::string_view(argv[i]) == "--config")
            {
                load_config_file(config, require_value(i, argc, argv, value));
            }
        }

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--config")
            {
                ++i;
            }
            else if (arg == "--port")
            {
                config.port = parse_port(arg, require_value(i, argc, argv, value));
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(require_value(i, argc, argv, value));
            }
            else if (arg == "--address")
            {
                config.address = require_value(i, argc, argv, value);
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(parse_unsigned(arg, require_value(i, argc, argv, value)));
            }
            else if (arg == "--max-pending")
            {
                config.max_pending_chunks = static_cast<std::size_t>(parse_unsigned(arg, require_value(i, argc, argv, value)));
            }
            else if (arg == "--download-idle-ms")
            {
                config.download_idle_timeout =
                    to_timeout<std::chrono::milliseconds>(arg, parse_unsigned(arg, require_value(i, argc, argv, value)));
            }
            else if (arg == "--upload-timeout")
            {
                config.upload_timeout = to_timeout<std::chrono::seconds>(arg, parse_unsigned(arg, require_value(i, argc, argv, value)));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(require_value(i, argc, argv, value));
            }
            else if (arg == "--log-level")
            {
                config.log_level = require_value(i, argc, argv, value);
            }
            else if (arg == "--help" || arg == "-h")
            {
                result.show_help = true;
            }
            else
            {
                throw ConfigError("Unknown argument: " + arg);
            }
        }

        return result;
    }

    void validate_config(const ServerConfig &config)
    {
        if (config.port == 0)
        {
            throw ConfigError("A listening port is required");
        }
        if (config.root.empty())
        {
            throw ConfigError("A data root directory is required");
        }
        if (config.max_pending_chunks == 0)
        {
            throw ConfigError("max_pending_chunks must be at least 1");
        }
        if (config.download_idle_timeout.count() <= 0 || config.download_idle_timeout > kMaxTimeout)
        {
            throw ConfigError("download idle timeout must be positive and at most one year");
        }
        if (config.upload_timeout.count() <= 0 || config.upload_timeout > kMaxTimeout)
        {
            throw ConfigError("upload timeout must be positive and at most one year");
        }
        if (config.max_frame_size < protocol::kFrameHeaderSize)
        {
            throw ConfigError("max_frame_size is too small");
        }
        if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off")
        {
            throw ConfigError("Unknown log level: " + config.log_level);
        }
    }

} // namespace treasury::server

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "treasury/framing.hpp"
#include "treasury/server/transfer_error.hpp"

namespace treasury::server
{

    // Upper bound for every configured timeout.
    inline constexpr std::chrono::hours kMaxTimeout{24 * 365};

    struct AccessTokenEntry
    {
        std::string token;
        UserId user_id{};
    };

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::size_t max_pending_chunks{4};
        std::chrono::milliseconds download_idle_timeout{std::chrono::seconds{10}};
        std::chrono::seconds upload_timeout{std::chrono::seconds{3600}};
        std::size_t max_frame_size{protocol::kDefaultMaxFrameSize};
        std::vector<AccessTokenEntry> access_tokens;
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};

        std::filesystem::path storage_dir() const { return root / "userfiles"; }
        std::filesystem::path upload_dir() const { return root / "uploads"; }
        std::filesystem::path records_path() const { return root / "records.json"; }
    };

    class ConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct CommandLine
    {
        ServerConfig config;
        bool show_help{false};
    };

    // Defaults, then the --config file, then the remaining flags.
    CommandLine parse_arguments(int argc, const char *const argv[]);

    void apply_config_json(ServerConfig &config, const nlohmann::json &json);

    void load_config_file(ServerConfig &config, const std::filesystem::path &path);

    void validate_config(const ServerConfig &config);

} // namespace treasury::server

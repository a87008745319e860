#include <cstdlib>
#include <iostream>
#include <vector>

#include "treasury/server/config.hpp"
#include "treasury/server/server.hpp"
#include "treasury/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "Treasury transfer server " << treasury::version() << "\n"
                  << "Usage: " << program_name
                  << " --port <PORT> --root <ROOT> [--config <FILE>] [--address <ADDRESS>] [--threads <N>]\n"
                     "       [--max-pending <N>] [--download-idle-ms <ms>] [--upload-timeout <seconds>]\n"
                     "       [--log <FILE>] [--log-level <LEVEL>]\n";
    }

} // namespace

int main(int argc, char *argv[])
{
    using treasury::server::ConfigError;
    using treasury::server::Server;

    treasury::server::CommandLine command_line;
    try
    {
        command_line = treasury::server::parse_arguments(argc, argv);
        if (command_line.show_help)
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        treasury::server::validate_config(command_line.config);
    }
    catch (const ConfigError &ex)
    {
        std::cerr << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    auto config = std::move(command_line.config);
    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.log_level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting Treasury server {} on {}:{}", treasury::version(), config.address, config.port);

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

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

#include "filedrop/server/config.hpp"
#include "filedrop/server/server.hpp"
#include "filedrop/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    using filedrop::server::ServerConfig;

    void print_usage(const char *program_name)
    {
        std::cout << "FileDrop server " << filedrop::version() << "\n"
                  << filedrop::server::usage(program_name);
    }

    // Defaults, then FILEDROP_* variables, then flags. Empty when the
    // process should exit with exit_code.
    std::optional<ServerConfig> load_config(int argc, char *argv[], int &exit_code)
    {
        ServerConfig config;
        try
        {
            filedrop::server::apply_environment(config);
            if (filedrop::server::apply_arguments(config, argc, argv) == filedrop::server::ArgumentsOutcome::ShowHelp)
            {
                print_usage(argv[0]);
                exit_code = EXIT_SUCCESS;
                return std::nullopt;
            }
        }
        catch (const filedrop::server::ConfigError &ex)
        {
            std::cerr << ex.what() << std::endl;
            print_usage(argv[0]);
            exit_code = EXIT_FAILURE;
            return std::nullopt;
        }
        return config;
    }

    void install_logger(const ServerConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.log_level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(std::move(logger));
    }

} // namespace

int main(int argc, char *argv[])
{
    int exit_code = EXIT_SUCCESS;
    auto config = load_config(argc, argv, exit_code);
    if (!config)
    {
        return exit_code;
    }

    try
    {
        install_logger(*config);
        spdlog::info("FileDrop server {} starting on {}:{}", filedrop::version(), config->address, config->port);

        filedrop::server::Server server(std::move(*config));
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

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "filedrop/server/upload_service.hpp"

namespace filedrop::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{8000};
        std::filesystem::path root{"data"};
        std::size_t worker_threads{0};
        std::uint64_t max_file_size{UploadLimits{}.max_file_size};
        std::uint64_t max_chunk_size{UploadLimits{}.max_chunk_size};
        double downtime_threshold_seconds{2.0};
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};

        // Largest request frame accepted: a base64 encoded chunk of
        // max_chunk_size plus room for the envelope.
        std::size_t max_frame_size() const noexcept;

        UploadServiceOptions service_options() const;
    };

    class ConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view)>;

    std::optional<std::string> process_environment(std::string_view name);

    // FILEDROP_HOST, FILEDROP_PORT, FILEDROP_ROOT, FILEDROP_THREADS,
    // FILEDROP_MAX_FILE_SIZE, FILEDROP_MAX_CHUNK_SIZE,
    // FILEDROP_DOWNTIME_THRESHOLD, FILEDROP_LOG. Throws ConfigError.
    void apply_environment(ServerConfig &config, const EnvironmentLookup &lookup = process_environment);

    enum class ArgumentsOutcome
    {
        Run,
        ShowHelp
    };

    // Command line flags override anything set before. Throws ConfigError.
    ArgumentsOutcome apply_arguments(ServerConfig &config, int argc, char *argv[]);

    std::string usage(std::string_view program_name);

} // namespace filedrop::server

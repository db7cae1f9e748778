#include "filedrop/server/config.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <limits>

namespace filedrop::server
{

    namespace
    {

        constexpr std::size_t kEnvelopeAllowance = 64 * 1024;

        constexpr std::array<std::string_view, 7> kLogLevels{"trace", "debug", "info", "warn",
                                                             "error", "critical", "off"};

        std::uint64_t parse_unsigned(std::string_view name, std::string_view text)
        {
            std::uint64_t value = 0;
            const auto *end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(text.data(), end, value);
            if (text.empty() || ec != std::errc{} || ptr != end)
            {
                throw ConfigError("Invalid value for " + std::string(name) + ": '" + std::string(text) + "'");
            }
            return value;
        }

        std::uint64_t parse_positive(std::string_view name, std::string_view text)
        {
            const auto value = parse_unsigned(name, text);
            if (value == 0)
            {
                throw ConfigError(std::string(name) + " must be greater than zero");
            }
            return value;
        }

        std::uint16_t parse_port(std::string_view name, std::string_view text)
        {
            const auto value = parse_positive(name, text);
            if (value > std::numeric_limits<std::uint16_t>::max())
            {
                throw ConfigError("Port out of range: " + std::string(text));
            }
            return static_cast<std::uint16_t>(value);
        }

        double parse_seconds(std::string_view name, std::string_view text)
        {
            double value = 0.0;
            const auto *end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(text.data(), end, value);
            if (text.empty() || ec != std::errc{} || ptr != end || !(value >= 0.0))
            {
                throw ConfigError("Invalid value for " + std::string(name) + ": '" + std::string(text) + "'");
            }
            return value;
        }

        std::string parse_log_level(std::string_view text)
        {
            if (std::find(kLogLevels.begin(), kLogLevels.end(), text) == kLogLevels.end())
            {
                throw ConfigError("Unknown log level: " + std::string(text));
            }
            return std::string(text);
        }

        std::string_view require_value(int &index, int argc, char *argv[], std::string_view flag)
        {
            if (index + 1 >= argc)
            {
                throw ConfigError("Missing value for " + std::string(flag));
            }
            ++index;
            return argv[index];
        }

    } // namespace

    std::size_t ServerConfig::max_frame_size() const noexcept
    {
        const auto encoded = ((max_chunk_size + 2) / 3) * 4;
        const auto limit = encoded + kEnvelopeAllowance;
        return static_cast<std::size_t>(std::min<std::uint64_t>(limit, std::numeric_limits<std::uint32_t>::max()));
    }

    UploadServiceOptions ServerConfig::service_options() const
    {
        return {.root = root,
                .limits = {.max_file_size = max_file_size, .max_chunk_size = max_chunk_size},
                .downtime_threshold_seconds = downtime_threshold_seconds};
    }

    std::optional<std::string> process_environment(std::string_view name)
    {
        const std::string key(name);
        if (const char *value = std::getenv(key.c_str()); value != nullptr)
        {
            return std::string(value);
        }
        return std::nullopt;
    }

    void apply_environment(ServerConfig &config, const EnvironmentLookup &lookup)
    {
        if (auto value = lookup("FILEDROP_HOST"))
        {
            config.address = *value;
        }
        if (auto value = lookup("FILEDROP_PORT"))
        {
            config.port = parse_port("FILEDROP_PORT", *value);
        }
        if (auto value = lookup("FILEDROP_ROOT"))
        {
            config.root = std::filesystem::path(*value);
        }
        if (auto value = lookup("FILEDROP_THREADS"))
        {
            config.worker_threads = static_cast<std::size_t>(parse_unsigned("FILEDROP_THREADS", *value));
        }
        if (auto value = lookup("FILEDROP_MAX_FILE_SIZE"))
        {
            config.max_file_size = parse_positive("FILEDROP_MAX_FILE_SIZE", *value);
        }
        if (auto value = lookup("FILEDROP_MAX_CHUNK_SIZE"))
        {
            config.max_chunk_size = parse_positive("FILEDROP_MAX_CHUNK_SIZE", *value);
        }
        if (auto value = lookup("FILEDROP_DOWNTIME_THRESHOLD"))
        {
            config.downtime_threshold_seconds = parse_seconds("FILEDROP_DOWNTIME_THRESHOLD", *value);
        }
        if (auto value = lookup("FILEDROP_LOG"))
        {
            config.log_file = std::filesystem::path(*value);
        }
    }

    ArgumentsOutcome apply_arguments(ServerConfig &config, int argc, char *argv[])
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view arg = argv[i];
            if (arg == "--port")
            {
                config.port = parse_port(arg, require_value(i, argc, argv, arg));
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--address")
            {
                config.address = std::string(require_value(i, argc, argv, arg));
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(parse_unsigned(arg, require_value(i, argc, argv, arg)));
            }
            else if (arg == "--max-file-size")
            {
                config.max_file_size = parse_positive(arg, require_value(i, argc, argv, arg));
            }
            else if (arg == "--max-chunk-size")
            {
                config.max_chunk_size = parse_positive(arg, require_value(i, argc, argv, arg));
            }
            else if (arg == "--downtime-threshold")
            {
                config.downtime_threshold_seconds = parse_seconds(arg, require_value(i, argc, argv, arg));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--log-level")
            {
                config.log_level = parse_log_level(require_value(i, argc, argv, arg));
            }
            else if (arg == "--help" || arg == "-h")
            {
                return ArgumentsOutcome::ShowHelp;
            }
            else
            {
                throw ConfigError("Unknown argument: " + std::string(arg));
            }
        }

        if (config.root.empty())
        {
            throw ConfigError("Root directory must not be empty");
        }
        return ArgumentsOutcome::Run;
    }

    std::string usage(std::string_view program_name)
    {
        std::string text = "Usage: " + std::string(program_name) +
                           " [--port <PORT>] [--root <DIR>] [--address <ADDRESS>] [--threads <N>]\n"
                           "       [--max-file-size <BYTES>] [--max-chunk-size <BYTES>]\n"
                           "       [--downtime-threshold <SECONDS>] [--log <FILE>] [--log-level <LEVEL>]\n"
                           "Environment: FILEDROP_HOST, FILEDROP_PORT, FILEDROP_ROOT, FILEDROP_THREADS,\n"
                           "             FILEDROP_MAX_FILE_SIZE, FILEDROP_MAX_CHUNK_SIZE,\n"
                           "             FILEDROP_DOWNTIME_THRESHOLD, FILEDROP_LOG\n";
        return text;
    }

} // namespace filedrop::server

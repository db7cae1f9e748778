#include "filedrop/server/upload_types.hpp"

#include <cstdio>
#include <ctime>

namespace filedrop::server
{

    UploadError::UploadError(filedrop::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    double ChunkEvent::duration_seconds() const noexcept
    {
        const auto seconds = seconds_between(start, end);
        return seconds > 0.0 ? seconds : 0.0;
    }

    std::optional<double> UploadStats::average_upload_bps() const noexcept
    {
        if (active_seconds <= 0.0)
        {
            return std::nullopt;
        }
        return static_cast<double>(bytes_received) / active_seconds;
    }

    std::optional<double> UploadStats::average_concurrency() const noexcept
    {
        if (active_seconds <= 0.0)
        {
            return std::nullopt;
        }
        return concurrency_seconds / active_seconds;
    }

    std::uint64_t chunk_count_for(std::uint64_t size, std::uint64_t chunk_size) noexcept
    {
        if (chunk_size == 0)
        {
            return 0;
        }
        return size / chunk_size + (size % chunk_size == 0 ? 0 : 1);
    }

    double seconds_between(Timestamp from, Timestamp to) noexcept
    {
        return std::chrono::duration<double>(to - from).count();
    }

    std::int64_t to_epoch_ms(Timestamp time) noexcept
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    }

    Timestamp from_epoch_ms(std::int64_t milliseconds) noexcept
    {
        return Timestamp{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds{milliseconds})};
    }

    std::string format_iso8601(Timestamp time)
    {
        const auto total_ms = to_epoch_ms(time);
        auto seconds = total_ms / 1000;
        auto millis = total_ms % 1000;
        if (millis < 0)
        {
            millis += 1000;
            seconds -= 1;
        }
        const auto as_time_t = static_cast<std::time_t>(seconds);
        std::tm utc{};
        gmtime_r(&as_time_t, &utc);
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900,
                      utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(millis));
        return buffer;
    }

} // namespace filedrop::server

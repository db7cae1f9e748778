#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "filedrop/error_codes.hpp"

namespace filedrop::server
{

    using Clock = std::chrono::system_clock;
    using Timestamp = Clock::time_point;

    // Fingerprint prefix used when the client could not supply a content hash.
    inline constexpr std::string_view kNoChecksumPrefix = "NOCHK:";

    class UploadError : public std::runtime_error
    {
    public:
        UploadError(filedrop::ErrorCode code, std::string message);

        filedrop::ErrorCode code() const noexcept { return code_; }

    private:
        filedrop::ErrorCode code_;
    };

    enum class UploadState : std::uint8_t
    {
        Pending,
        Finalized
    };

    struct Upload
    {
        std::string handle;
        std::string filename;
        std::uint64_t size{};
        std::uint64_t chunk_size{};
        std::uint64_t chunk_count{};
        std::string fingerprint;
        UploadState state{UploadState::Pending};
        Timestamp created_at{};
        Timestamp updated_at{};
        std::optional<std::string> artifact;

        bool finalized() const noexcept { return state == UploadState::Finalized; }
        bool has_content_hash() const noexcept { return !fingerprint.starts_with(kNoChecksumPrefix); }
    };

    // Timing of the write that last stored one chunk.
    struct ChunkEvent
    {
        std::uint64_t index{};
        Timestamp start{};
        Timestamp end{};
        std::uint64_t bytes{};

        double duration_seconds() const noexcept;
    };

    struct UploadStats
    {
        std::uint64_t bytes_received{};
        std::optional<Timestamp> first_activity;
        std::optional<Timestamp> last_activity_end;
        double active_seconds{};
        double downtime_seconds{};
        double assembly_seconds{};
        std::uint32_t peak_concurrency{};
        double concurrency_seconds{};
        std::optional<Timestamp> upload_start;
        std::optional<Timestamp> upload_end;
        std::optional<Timestamp> finalized_at;

        // Live view of in-flight chunk writes; not persisted.
        std::uint32_t current_concurrency{};
        std::optional<Timestamp> concurrency_changed_at;

        std::optional<double> average_upload_bps() const noexcept;
        std::optional<double> average_concurrency() const noexcept;
    };

    std::uint64_t chunk_count_for(std::uint64_t size, std::uint64_t chunk_size) noexcept;

    double seconds_between(Timestamp from, Timestamp to) noexcept;

    std::int64_t to_epoch_ms(Timestamp time) noexcept;
    Timestamp from_epoch_ms(std::int64_t milliseconds) noexcept;

    // UTC, millisecond precision, trailing Z.
    std::string format_iso8601(Timestamp time);

} // namespace filedrop::server

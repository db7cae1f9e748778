#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include "filedrop/server/upload_types.hpp"

namespace filedrop::server
{

    struct TimelineSummary
    {
        std::optional<Timestamp> upload_start;
        std::optional<Timestamp> upload_end;
        std::uint64_t bytes{};
        double active_seconds{};
        double downtime_seconds{};
        double concurrency_seconds{};
        std::uint32_t peak_concurrency{};
        std::optional<double> average_concurrency;
    };

    // Sweep over the [start, end] interval of every chunk write. Active time is
    // the measure of the union of intervals, downtime is the rest of the
    // span, and concurrency_seconds integrates the number of open intervals.
    // At equal timestamps closes are applied before opens, so touching
    // intervals never count as concurrent.
    TimelineSummary reconstruct_timeline(std::span<const ChunkEvent> events);

} // namespace filedrop::server

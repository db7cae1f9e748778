#include "filedrop/server/timeline.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace filedrop::server
{

    TimelineSummary reconstruct_timeline(std::span<const ChunkEvent> events)
    {
        TimelineSummary summary{};
        if (events.empty())
        {
            return summary;
        }

        std::vector<std::pair<Timestamp, int>> edges;
        edges.reserve(events.size() * 2);
        for (const auto &event : events)
        {
            const auto end = std::max(event.start, event.end);
            edges.emplace_back(event.start, +1);
            edges.emplace_back(end, -1);
            summary.bytes += event.bytes;
        }
        std::sort(edges.begin(), edges.end());

        std::int64_t open = 0;
        std::int64_t peak = 0;
        auto last = edges.front().first;
        summary.upload_start = last;
        for (const auto &[time, delta] : edges)
        {
            if (time > last)
            {
                const auto interval = seconds_between(last, time);
                if (open > 0)
                {
                    summary.active_seconds += interval;
                    summary.concurrency_seconds += static_cast<double>(open) * interval;
                }
                last = time;
            }
            open += delta;
            peak = std::max(peak, open);
        }
        summary.upload_end = last;
        // Zero length writes close before they open; count them as one.
        summary.peak_concurrency = static_cast<std::uint32_t>(std::max<std::int64_t>(peak, 1));

        const auto span = seconds_between(*summary.upload_start, *summary.upload_end);
        summary.downtime_seconds = std::max(0.0, span - summary.active_seconds);
        if (summary.active_seconds > 0.0)
        {
            summary.average_concurrency = summary.concurrency_seconds / summary.active_seconds;
        }
        return summary;
    }

} // namespace filedrop::server

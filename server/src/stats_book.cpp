#include "filedrop/server/stats_book.hpp"

#include <algorithm>

namespace filedrop::server
{

    namespace
    {

        void advance_concurrency(UploadStats &stats, Timestamp now)
        {
            if (stats.concurrency_changed_at && stats.current_concurrency > 0)
            {
                const auto elapsed = std::max(0.0, seconds_between(*stats.concurrency_changed_at, now));
                stats.concurrency_seconds += static_cast<double>(stats.current_concurrency) * elapsed;
            }
            stats.concurrency_changed_at = now;
        }

    } // namespace

    StatsBook::StatsBook(MetadataStore &store, double downtime_threshold_seconds)
        : store_(store), downtime_threshold_(downtime_threshold_seconds), stats_(store_.load_stats())
    {
    }

    void StatsBook::ensure(const std::string &handle)
    {
        std::lock_guard lock(mutex_);
        if (stats_.contains(handle))
        {
            return;
        }
        const UploadStats fresh{};
        store_.save_stats(handle, fresh);
        stats_.emplace(handle, fresh);
    }

    UploadStats StatsBook::get(const std::string &handle) const
    {
        std::lock_guard lock(mutex_);
        if (auto it = stats_.find(handle); it != stats_.end())
        {
            return it->second;
        }
        return UploadStats{};
    }

    void StatsBook::begin_write(const std::string &handle, Timestamp now)
    {
        std::lock_guard lock(mutex_);
        auto &stats = stats_[handle];
        advance_concurrency(stats, now);
        ++stats.current_concurrency;
        stats.peak_concurrency = std::max(stats.peak_concurrency, stats.current_concurrency);
    }

    void StatsBook::end_write(const std::string &handle, Timestamp now)
    {
        std::lock_guard lock(mutex_);
        auto &stats = stats_[handle];
        advance_concurrency(stats, now);
        if (stats.current_concurrency > 0)
        {
            --stats.current_concurrency;
        }
    }

    void StatsBook::record_chunk(const std::string &handle, const ChunkEvent &event, bool duplicate)
    {
        std::lock_guard lock(mutex_);
        auto updated = stats_[handle];
        if (!duplicate)
        {
            updated.bytes_received += event.bytes;
        }

        if (updated.last_activity_end)
        {
            const auto gap = seconds_between(*updated.last_activity_end, event.start);
            if (gap > downtime_threshold_)
            {
                updated.downtime_seconds += gap;
            }
            else
            {
                updated.active_seconds += std::max(0.0, gap);
            }
        }
        else
        {
            updated.first_activity = event.start;
        }
        updated.active_seconds += event.duration_seconds();
        updated.last_activity_end = std::max(event.end, updated.last_activity_end.value_or(event.end));

        store_.save_stats(handle, updated);
        stats_[handle] = std::move(updated);
    }

    void StatsBook::apply_timeline(const std::string &handle, const TimelineSummary &timeline,
                                   std::uint64_t bytes_received, double assembly_seconds, Timestamp finalized_at)
    {
        std::lock_guard lock(mutex_);
        auto updated = stats_[handle];
        updated.upload_start = timeline.upload_start;
        updated.upload_end = timeline.upload_end;
        updated.bytes_received = bytes_received;
        updated.active_seconds = timeline.active_seconds;
        updated.downtime_seconds = timeline.downtime_seconds;
        updated.concurrency_seconds = timeline.concurrency_seconds;
        updated.peak_concurrency = timeline.peak_concurrency;
        updated.assembly_seconds = assembly_seconds;
        updated.finalized_at = finalized_at;
        updated.current_concurrency = 0;
        updated.concurrency_changed_at.reset();

        store_.save_stats(handle, updated);
        stats_[handle] = std::move(updated);
    }

} // namespace filedrop::server

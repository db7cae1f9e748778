#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "filedrop/server/metadata_store.hpp"
#include "filedrop/server/timeline.hpp"
#include "filedrop/server/upload_types.hpp"

namespace filedrop::server
{

    // Per-upload telemetry. Values maintained during ingestion are a live
    // estimate; apply_timeline() replaces them with the exact figures.
    class StatsBook
    {
    public:
        StatsBook(MetadataStore &store, double downtime_threshold_seconds);

        // Creates the row if it does not exist yet.
        void ensure(const std::string &handle);

        UploadStats get(const std::string &handle) const;

        void begin_write(const std::string &handle, Timestamp now);
        void end_write(const std::string &handle, Timestamp now);

        // A gap since the previous write longer than the threshold counts as
        // downtime, a shorter one as active time. Duplicates add no bytes.
        void record_chunk(const std::string &handle, const ChunkEvent &event, bool duplicate);

        // bytes_received is the assembled size; the ledger can miss a chunk
        // whose bookkeeping lost the race against finalize.
        void apply_timeline(const std::string &handle, const TimelineSummary &timeline, std::uint64_t bytes_received,
                            double assembly_seconds, Timestamp finalized_at);

        double downtime_threshold() const noexcept { return downtime_threshold_; }

    private:
        MetadataStore &store_;
        double downtime_threshold_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, UploadStats> stats_;
    };

} // namespace filedrop::server

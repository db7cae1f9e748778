#include "filedrop/server/ingestion.hpp"

#include <spdlog/spdlog.h>

namespace filedrop::server
{

    namespace
    {

        // Keeps the live in-flight counter balanced on every exit path.
        class InFlightWrite
        {
        public:
            InFlightWrite(StatsBook &stats, const std::string &handle, Timestamp start)
                : stats_(stats), handle_(handle)
            {
                stats_.begin_write(handle_, start);
            }

            ~InFlightWrite()
            {
                stats_.end_write(handle_, Clock::now());
            }

            InFlightWrite(const InFlightWrite &) = delete;
            InFlightWrite &operator=(const InFlightWrite &) = delete;

        private:
            StatsBook &stats_;
            const std::string &handle_;
        };

        void check_writable(const Upload &upload)
        {
            if (upload.finalized())
            {
                throw UploadError(filedrop::ErrorCode::AlreadyFinalized, "Upload already finalized");
            }
        }

    } // namespace

    IngestionService::IngestionService(UploadRegistry &registry, ChunkLedger &ledger, StatsBook &stats,
                                       ChunkStore &chunks, UploadLocks &locks)
        : registry_(registry), ledger_(ledger), stats_(stats), chunks_(chunks), locks_(locks)
    {
    }

    ChunkAck IngestionService::put_chunk(const std::string &handle, std::int64_t index,
                                         std::span<const std::byte> data)
    {
        const auto start = Clock::now();
        const auto upload = registry_.get(handle);
        check_writable(upload);
        if (index < 0 || static_cast<std::uint64_t>(index) >= upload.chunk_count)
        {
            throw UploadError(filedrop::ErrorCode::IndexOutOfRange,
                              "Chunk index must be below " + std::to_string(upload.chunk_count));
        }
        if (data.empty())
        {
            throw UploadError(filedrop::ErrorCode::EmptyBody, "Chunk body is empty");
        }
        const auto chunk_index = static_cast<std::uint64_t>(index);

        InFlightWrite in_flight(stats_, handle, start);
        try
        {
            chunks_.put(handle, chunk_index, data);
        }
        catch (const UploadError &)
        {
            // A finalize that retired the staging area first wins.
            check_writable(registry_.get(handle));
            throw;
        }
        catch (const std::exception &ex)
        {
            check_writable(registry_.get(handle));
            throw UploadError(filedrop::ErrorCode::StorageError, ex.what());
        }
        const ChunkEvent event{
            .index = chunk_index,
            .start = start,
            .end = Clock::now(),
            .bytes = static_cast<std::uint64_t>(data.size()),
        };

        auto lock = locks_.acquire(handle);
        check_writable(registry_.get(handle));

        const auto update = ledger_.record(handle, event);
        try
        {
            stats_.record_chunk(handle, event, update.existed);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Stats update for {} chunk {} failed, rolling back: {}", handle, chunk_index, ex.what());
            try
            {
                ledger_.restore(handle, chunk_index, update.previous);
            }
            catch (const std::exception &restore_error)
            {
                spdlog::error("Ledger rollback for {} chunk {} failed: {}", handle, chunk_index,
                              restore_error.what());
            }
            throw UploadError(filedrop::ErrorCode::StorageError, std::string("Failed to record chunk: ") + ex.what());
        }

        spdlog::debug("Stored chunk {} of upload {} ({} bytes{})", chunk_index, handle, event.bytes,
                      update.existed ? ", duplicate" : "");
        return {.handle = handle, .index = chunk_index, .bytes = event.bytes, .duplicate = update.existed};
    }

} // namespace filedrop::server

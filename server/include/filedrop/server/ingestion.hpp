#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "filedrop/server/chunk_ledger.hpp"
#include "filedrop/server/chunk_store.hpp"
#include "filedrop/server/stats_book.hpp"
#include "filedrop/server/upload_locks.hpp"
#include "filedrop/server/upload_registry.hpp"

namespace filedrop::server
{

    struct ChunkAck
    {
        std::string handle;
        std::uint64_t index{};
        std::uint64_t bytes{};
        bool duplicate{};
    };

    class IngestionService
    {
    public:
        IngestionService(UploadRegistry &registry, ChunkLedger &ledger, StatsBook &stats, ChunkStore &chunks,
                         UploadLocks &locks);

        // Stores one chunk, overwriting earlier bytes for the same index.
        // Throws UploadError: NotFound, AlreadyFinalized, IndexOutOfRange,
        // EmptyBody or StorageError.
        ChunkAck put_chunk(const std::string &handle, std::int64_t index, std::span<const std::byte> data);

    private:
        UploadRegistry &registry_;
        ChunkLedger &ledger_;
        StatsBook &stats_;
        ChunkStore &chunks_;
        UploadLocks &locks_;
    };

} // namespace filedrop::server

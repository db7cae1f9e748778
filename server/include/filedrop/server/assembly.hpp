#pragma once

#include <filesystem>
#include <string>

#include "filedrop/server/artifact_store.hpp"
#include "filedrop/server/chunk_ledger.hpp"
#include "filedrop/server/chunk_store.hpp"
#include "filedrop/server/stats_book.hpp"
#include "filedrop/server/upload_locks.hpp"
#include "filedrop/server/upload_registry.hpp"

namespace filedrop::server
{

    struct FinalizeResult
    {
        std::string artifact;
        std::filesystem::path path;
        bool already{};
        UploadStats stats;
    };

    class AssemblyEngine
    {
    public:
        AssemblyEngine(UploadRegistry &registry, ChunkLedger &ledger, StatsBook &stats, ChunkStore &chunks,
                       ArtifactStore &artifacts, UploadLocks &locks);

        // Concatenates chunks 0..n-1, verifies size and checksum, commits the
        // artifact and recomputes the upload's telemetry from its chunk
        // events. On any integrity failure the upload stays pending.
        FinalizeResult finalize(const std::string &handle);

    private:
        std::string assemble(const Upload &upload, const std::filesystem::path &target);

        UploadRegistry &registry_;
        ChunkLedger &ledger_;
        StatsBook &stats_;
        ChunkStore &chunks_;
        ArtifactStore &artifacts_;
        UploadLocks &locks_;
    };

} // namespace filedrop::server

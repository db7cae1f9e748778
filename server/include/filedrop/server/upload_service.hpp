#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "filedrop/server/artifact_store.hpp"
#include "filedrop/server/assembly.hpp"
#include "filedrop/server/chunk_ledger.hpp"
#include "filedrop/server/chunk_store.hpp"
#include "filedrop/server/ingestion.hpp"
#include "filedrop/server/metadata_store.hpp"
#include "filedrop/server/stats_book.hpp"
#include "filedrop/server/upload_locks.hpp"
#include "filedrop/server/upload_registry.hpp"

namespace filedrop::server
{

    struct UploadServiceOptions
    {
        std::filesystem::path root{"data"};
        UploadLimits limits{};
        double downtime_threshold_seconds{2.0};
    };

    struct OpenedUpload
    {
        Upload upload;
        std::vector<std::uint64_t> received_indices;
        bool resumed{};
    };

    struct UploadStatus
    {
        Upload upload;
        std::uint64_t received{};
        std::vector<std::uint64_t> missing;
        UploadStats stats;
    };

    struct ArtifactInfo
    {
        std::string name;
        std::uint64_t size{};
    };

    // Everything a session needs, rooted at one data directory:
    //   <root>/state    metadata tables
    //   <root>/staging  chunk bytes of pending uploads
    //   <root>/uploads  finished artifacts
    class UploadService
    {
    public:
        explicit UploadService(UploadServiceOptions options);

        // Uses the given staging store instead of one under <root>/staging.
        UploadService(UploadServiceOptions options, std::unique_ptr<ChunkStore> chunks);

        OpenedUpload open(std::string_view checksum, std::string_view filename, std::int64_t size,
                          std::int64_t chunk_size);

        ChunkAck put_chunk(const std::string &handle, std::int64_t index, std::span<const std::byte> data);

        UploadStatus status(const std::string &handle) const;

        FinalizeResult finalize(const std::string &handle);

        ArtifactInfo fetch_info(std::string_view filename) const;

        std::vector<std::byte> fetch_range(std::string_view filename, std::uint64_t offset,
                                           std::uint64_t max_bytes) const;

        const UploadLimits &limits() const noexcept { return registry_.limits(); }

        const std::filesystem::path &artifacts_root() const noexcept { return artifacts_.root(); }

    private:
        UploadServiceOptions options_;
        MetadataStore metadata_;
        UploadRegistry registry_;
        ChunkLedger ledger_;
        StatsBook stats_;
        std::unique_ptr<ChunkStore> chunks_;
        ArtifactStore artifacts_;
        UploadLocks locks_;
        IngestionService ingestion_;
        AssemblyEngine assembly_;
    };

} // namespace filedrop::server

#include "filedrop/server/upload_service.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace filedrop::server
{

    UploadService::UploadService(UploadServiceOptions options)
        : UploadService(options, std::make_unique<LocalChunkStore>(options.root / "staging"))
    {
    }

    UploadService::UploadService(UploadServiceOptions options, std::unique_ptr<ChunkStore> chunks)
        : options_(std::move(options)),
          metadata_(options_.root / "state"),
          registry_(metadata_, options_.limits),
          ledger_(metadata_),
          stats_(metadata_, options_.downtime_threshold_seconds),
          chunks_(std::move(chunks)),
          artifacts_(options_.root / "uploads", options_.root / "assembling"),
          ingestion_(registry_, ledger_, stats_, *chunks_, locks_),
          assembly_(registry_, ledger_, stats_, *chunks_, artifacts_, locks_)
    {
        spdlog::info("Upload service ready under {} (schema v{})", options_.root.string(), metadata_.schema_version());
    }

    OpenedUpload UploadService::open(std::string_view checksum, std::string_view filename, std::int64_t size,
                                     std::int64_t chunk_size)
    {
        auto opened = registry_.open(checksum, filename, size, chunk_size);
        const auto &handle = opened.upload.handle;
        chunks_->prepare(handle);
        {
            auto lock = locks_.acquire(handle);
            stats_.ensure(handle);
        }
        return {.upload = opened.upload,
                .received_indices = ledger_.received_indices(handle),
                .resumed = opened.resumed};
    }

    ChunkAck UploadService::put_chunk(const std::string &handle, std::int64_t index, std::span<const std::byte> data)
    {
        return ingestion_.put_chunk(handle, index, data);
    }

    UploadStatus UploadService::status(const std::string &handle) const
    {
        UploadStatus status;
        status.upload = registry_.get(handle);
        const auto received = ledger_.received_indices(handle);
        status.received = received.size();
        for (std::uint64_t index = 0; index < status.upload.chunk_count; ++index)
        {
            if (!std::binary_search(received.begin(), received.end(), index))
            {
                status.missing.push_back(index);
            }
        }
        status.stats = stats_.get(handle);
        return status;
    }

    FinalizeResult UploadService::finalize(const std::string &handle)
    {
        return assembly_.finalize(handle);
    }

    ArtifactInfo UploadService::fetch_info(std::string_view filename) const
    {
        const auto path = artifacts_.resolve(filename);
        return {.name = path.filename().string(), .size = artifacts_.size_of(filename)};
    }

    std::vector<std::byte> UploadService::fetch_range(std::string_view filename, std::uint64_t offset,
                                                      std::uint64_t max_bytes) const
    {
        return artifacts_.read_range(filename, offset, max_bytes);
    }

} // namespace filedrop::server

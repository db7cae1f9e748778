#include "filedrop/server/assembly.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "filedrop/crypto.hpp"
#include "filedrop/server/timeline.hpp"

namespace filedrop::server
{

    namespace
    {

        bool equals_ignore_case(std::string_view lhs, std::string_view rhs)
        {
            return lhs.size() == rhs.size() &&
                   std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b)
                              { return std::tolower(a) == std::tolower(b); });
        }

        // Removes the partial artifact unless released.
        class TemporaryFile
        {
        public:
            explicit TemporaryFile(std::filesystem::path path) : path_(std::move(path)) {}

            ~TemporaryFile()
            {
                if (!released_)
                {
                    std::error_code ec;
                    std::filesystem::remove(path_, ec);
                }
            }

            TemporaryFile(const TemporaryFile &) = delete;
            TemporaryFile &operator=(const TemporaryFile &) = delete;

            const std::filesystem::path &path() const noexcept { return path_; }
            void release() noexcept { released_ = true; }

        private:
            std::filesystem::path path_;
            bool released_{false};
        };

    } // namespace

    AssemblyEngine::AssemblyEngine(UploadRegistry &registry, ChunkLedger &ledger, StatsBook &stats,
                                   ChunkStore &chunks, ArtifactStore &artifacts, UploadLocks &locks)
        : registry_(registry), ledger_(ledger), stats_(stats), chunks_(chunks), artifacts_(artifacts), locks_(locks)
    {
    }

    FinalizeResult AssemblyEngine::finalize(const std::string &handle)
    {
        registry_.get(handle);
        auto lock = locks_.acquire(handle);
        const auto upload = registry_.get(handle);
        if (upload.finalized())
        {
            const auto artifact = upload.artifact.value_or(upload.filename);
            return {.artifact = artifact,
                    .path = artifacts_.root() / artifact,
                    .already = true,
                    .stats = stats_.get(handle)};
        }

        const auto present = chunks_.list_present(handle);
        const auto in_range = static_cast<std::uint64_t>(
            std::count_if(present.begin(), present.end(), [&](std::uint64_t index)
                          { return index < upload.chunk_count; }));
        if (in_range != upload.chunk_count)
        {
            spdlog::warn("Finalize of {} refused: {} of {} chunks present", handle, in_range, upload.chunk_count);
            throw UploadError(filedrop::ErrorCode::Incomplete, "Have " + std::to_string(in_range) + " of " +
                                                                   std::to_string(upload.chunk_count) + " chunks");
        }

        TemporaryFile assembled(artifacts_.assembly_path(handle));
        const auto assembly_start = Clock::now();
        const auto digest = assemble(upload, assembled.path());
        const auto assembly_seconds = std::max(0.0, seconds_between(assembly_start, Clock::now()));

        if (upload.has_content_hash() && !equals_ignore_case(digest, upload.fingerprint))
        {
            spdlog::warn("Checksum mismatch for {}: expected {}, computed {}", handle, upload.fingerprint, digest);
            throw UploadError(filedrop::ErrorCode::ChecksumMismatch,
                              "Expected " + upload.fingerprint + ", computed " + digest);
        }

        const auto artifact = artifacts_.commit(assembled.path(), upload.filename, handle);
        assembled.release();
        try
        {
            registry_.mark_finalized(handle, artifact);
        }
        catch (const std::exception &ex)
        {
            // The upload stays pending; do not leave an artifact behind for it.
            TemporaryFile orphan(artifacts_.root() / artifact);
            spdlog::error("Could not mark {} finalized, discarding {}: {}", handle, artifact, ex.what());
            throw;
        }

        const auto events = ledger_.events(handle);
        const auto timeline = reconstruct_timeline(events);
        const auto finalized_at = Clock::now();
        try
        {
            stats_.apply_timeline(handle, timeline, upload.size, assembly_seconds, finalized_at);
        }
        catch (const std::exception &ex)
        {
            // The artifact is committed; telemetry is reported but not persisted.
            spdlog::error("Persisting final stats for {} failed: {}", handle, ex.what());
        }

        chunks_.retire(handle);

        spdlog::info("Finalized upload {} as {} ({} bytes, {:.3f}s active, {:.3f}s downtime, peak concurrency {})",
                     handle, artifact, upload.size, timeline.active_seconds, timeline.downtime_seconds,
                     timeline.peak_concurrency);

        auto stats = stats_.get(handle);
        stats.upload_start = timeline.upload_start;
        stats.upload_end = timeline.upload_end;
        stats.bytes_received = upload.size;
        stats.active_seconds = timeline.active_seconds;
        stats.downtime_seconds = timeline.downtime_seconds;
        stats.concurrency_seconds = timeline.concurrency_seconds;
        stats.peak_concurrency = timeline.peak_concurrency;
        stats.assembly_seconds = assembly_seconds;
        stats.finalized_at = finalized_at;
        return {.artifact = artifact, .path = artifacts_.root() / artifact, .already = false, .stats = stats};
    }

    std::string AssemblyEngine::assemble(const Upload &upload, const std::filesystem::path &target)
    {
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw UploadError(filedrop::ErrorCode::StorageError, "Cannot create " + target.string());
        }

        crypto::Sha256 hasher;
        std::uint64_t written = 0;
        for (std::uint64_t index = 0; index < upload.chunk_count; ++index)
        {
            const auto data = chunks_.get(upload.handle, index);
            out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
            if (!out)
            {
                throw UploadError(filedrop::ErrorCode::StorageError, "Write failed while assembling " +
                                                                         upload.handle);
            }
            hasher.update(data);
            written += data.size();
        }
        out.flush();
        if (!out)
        {
            throw UploadError(filedrop::ErrorCode::StorageError, "Flush failed while assembling " + upload.handle);
        }
        out.close();

        if (written != upload.size)
        {
            spdlog::warn("Size mismatch for {}: expected {}, assembled {}", upload.handle, upload.size, written);
            throw UploadError(filedrop::ErrorCode::SizeMismatch, "Expected " + std::to_string(upload.size) +
                                                                     " bytes, assembled " + std::to_string(written));
        }
        return hasher.final_hex();
    }

} // namespace filedrop::server

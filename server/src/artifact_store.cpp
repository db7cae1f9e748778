#include "filedrop/server/artifact_store.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "filedrop/server/filesystem.hpp"
#include "filedrop/server/upload_types.hpp"

namespace filedrop::server
{

    namespace
    {
        constexpr auto kAssemblingSuffix = ".assembling";
    }

    ArtifactStore::ArtifactStore(std::filesystem::path root, std::filesystem::path work_dir)
        : root_(std::move(root)), work_dir_(std::move(work_dir))
    {
        std::filesystem::create_directories(root_);
        std::filesystem::create_directories(work_dir_);
        // Only assemblies interrupted by a restart can be here.
        for (const auto &entry : std::filesystem::directory_iterator(work_dir_))
        {
            std::error_code ec;
            std::filesystem::remove_all(entry.path(), ec);
            if (ec)
            {
                spdlog::debug("Could not remove stale assembly file {}: {}", entry.path().string(), ec.message());
                continue;
            }
            spdlog::debug("Removed stale assembly file {}", entry.path().string());
        }
    }

    std::filesystem::path ArtifactStore::assembly_path(const std::string &handle) const
    {
        return work_dir_ / (handle + kAssemblingSuffix);
    }

    std::string ArtifactStore::commit(const std::filesystem::path &assembled, const std::string &filename,
                                      const std::string &handle)
    {
        std::lock_guard lock(commit_mutex_);
        std::filesystem::path candidate = filename;
        if (std::filesystem::exists(root_ / candidate))
        {
            const std::filesystem::path original = filename;
            const auto stem = original.stem().string() + "-" + handle;
            const auto extension = original.extension().string();
            candidate = stem + extension;
            for (int attempt = 2; std::filesystem::exists(root_ / candidate); ++attempt)
            {
                candidate = stem + "-" + std::to_string(attempt) + extension;
            }
        }

        std::error_code ec;
        std::filesystem::rename(assembled, root_ / candidate, ec);
        if (ec)
        {
            throw UploadError(filedrop::ErrorCode::StorageError,
                              "Cannot move assembled file into place: " + ec.message());
        }
        return candidate.string();
    }

    std::filesystem::path ArtifactStore::resolve(std::string_view requested) const
    {
        const auto path = root_ / sanitize_filename(requested);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            throw UploadError(filedrop::ErrorCode::NotFound, "No such file");
        }
        return path;
    }

    std::uint64_t ArtifactStore::size_of(std::string_view requested) const
    {
        const auto path = resolve(requested);
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            throw UploadError(filedrop::ErrorCode::StorageError, "Cannot stat file: " + ec.message());
        }
        return size;
    }

    std::vector<std::byte> ArtifactStore::read_range(std::string_view requested, std::uint64_t offset,
                                                     std::uint64_t max_bytes) const
    {
        const auto path = resolve(requested);
        const auto total = size_of(requested);
        if (offset > total)
        {
            throw UploadError(filedrop::ErrorCode::InvalidParameters, "Offset beyond end of file");
        }
        const auto limit = max_bytes == 0 ? kFetchChunkSize : std::min(max_bytes, kFetchChunkSize);
        std::vector<std::byte> buffer(static_cast<std::size_t>(std::min(limit, total - offset)));

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw UploadError(filedrop::ErrorCode::StorageError, "Failed to open file");
        }
        file.seekg(static_cast<std::streamoff>(offset));
        file.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        buffer.resize(static_cast<std::size_t>(file.gcount()));
        return buffer;
    }

} // namespace filedrop::server

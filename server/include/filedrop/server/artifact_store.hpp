#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace filedrop::server
{

    inline constexpr std::uint64_t kFetchChunkSize = 1ULL << 20;

    // Directory of completed files. Names are unique; a commit never
    // replaces an existing artifact. Files being assembled live in a
    // separate work directory that is emptied at startup.
    class ArtifactStore
    {
    public:
        ArtifactStore(std::filesystem::path root, std::filesystem::path work_dir);

        const std::filesystem::path &root() const noexcept { return root_; }

        // Per-upload file in the work directory the assembly engine writes into.
        std::filesystem::path assembly_path(const std::string &handle) const;

        // Renames assembled into the store and returns the artifact name:
        // filename, or "<stem>-<handle><ext>" when filename is taken.
        std::string commit(const std::filesystem::path &assembled, const std::string &filename,
                           const std::string &handle);

        std::filesystem::path resolve(std::string_view requested) const;

        std::uint64_t size_of(std::string_view requested) const;

        // Up to max_bytes (capped at kFetchChunkSize, 0 meaning the cap)
        // starting at offset.
        std::vector<std::byte> read_range(std::string_view requested, std::uint64_t offset,
                                          std::uint64_t max_bytes) const;

    private:
        std::filesystem::path root_;
        std::filesystem::path work_dir_;
        std::mutex commit_mutex_;
    };

} // namespace filedrop::server

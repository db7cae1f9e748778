#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "filedrop/server/metadata_store.hpp"
#include "filedrop/server/upload_types.hpp"

namespace filedrop::server
{

    struct UploadLimits
    {
        std::uint64_t max_file_size{50ULL * 1024 * 1024 * 1024};
        std::uint64_t max_chunk_size{64ULL * 1024 * 1024};
    };

    struct OpenResult
    {
        Upload upload;
        bool resumed{};
    };

    class UploadRegistry
    {
    public:
        UploadRegistry(MetadataStore &store, UploadLimits limits);

        // Returns the pending upload matching (fingerprint, filename, size)
        // with its original chunk layout, or creates a new one.
        OpenResult open(std::string_view fingerprint, std::string_view filename, std::int64_t size,
                        std::int64_t chunk_size);

        // Returns true when the upload had already been finalized.
        bool mark_finalized(const std::string &handle, const std::string &artifact);

        Upload get(const std::string &handle) const;

        std::optional<Upload> find(const std::string &handle) const;

        const UploadLimits &limits() const noexcept { return limits_; }

    private:
        std::string generate_handle() const;

        MetadataStore &store_;
        UploadLimits limits_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, Upload> uploads_;
    };

} // namespace filedrop::server

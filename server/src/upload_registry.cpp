#include "filedrop/server/upload_registry.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "filedrop/crypto.hpp"
#include "filedrop/server/filesystem.hpp"

namespace filedrop::server
{

    namespace
    {

        std::string_view trim(std::string_view value)
        {
            const auto is_space = [](char c)
            { return std::isspace(static_cast<unsigned char>(c)) != 0; };
            while (!value.empty() && is_space(value.front()))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && is_space(value.back()))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        std::string to_lower(std::string_view value)
        {
            std::string result(value);
            std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return result;
        }

    } // namespace

    UploadRegistry::UploadRegistry(MetadataStore &store, UploadLimits limits)
        : store_(store), limits_(limits)
    {
        for (auto &upload : store_.load_uploads())
        {
            auto handle = upload.handle;
            uploads_.emplace(std::move(handle), std::move(upload));
        }
        spdlog::info("Loaded {} upload records", uploads_.size());
    }

    OpenResult UploadRegistry::open(std::string_view fingerprint, std::string_view filename, std::int64_t size,
                                    std::int64_t chunk_size)
    {
        if (trim(filename).empty())
        {
            throw UploadError(filedrop::ErrorCode::InvalidParameters, "Filename is required");
        }
        if (size <= 0 || chunk_size <= 0)
        {
            throw UploadError(filedrop::ErrorCode::InvalidParameters, "Size and chunk size must be positive");
        }
        const auto file_size = static_cast<std::uint64_t>(size);
        const auto proposed_chunk = static_cast<std::uint64_t>(chunk_size);
        if (file_size > limits_.max_file_size)
        {
            throw UploadError(filedrop::ErrorCode::SizeLimitExceeded,
                              "File exceeds maximum size of " + std::to_string(limits_.max_file_size) + " bytes");
        }
        if (proposed_chunk > limits_.max_chunk_size)
        {
            throw UploadError(filedrop::ErrorCode::ChunkSizeLimitExceeded,
                              "Chunk exceeds maximum size of " + std::to_string(limits_.max_chunk_size) + " bytes");
        }

        const auto clean_name = sanitize_filename(filename);
        auto key = to_lower(trim(fingerprint));
        if (key.empty())
        {
            key = std::string(kNoChecksumPrefix) + clean_name + ":" + std::to_string(file_size);
        }

        std::lock_guard lock(mutex_);
        const auto existing = std::find_if(uploads_.begin(), uploads_.end(), [&](const auto &item)
                                           {
            const auto &upload = item.second;
            return !upload.finalized() && upload.fingerprint == key && upload.filename == clean_name &&
                   upload.size == file_size; });
        if (existing != uploads_.end())
        {
            spdlog::info("Resuming upload {} for {} ({} chunks of {} bytes)", existing->first, clean_name,
                         existing->second.chunk_count, existing->second.chunk_size);
            return {.upload = existing->second, .resumed = true};
        }

        const auto now = Clock::now();
        Upload upload{};
        upload.handle = generate_handle();
        upload.filename = clean_name;
        upload.size = file_size;
        upload.chunk_size = proposed_chunk;
        upload.chunk_count = chunk_count_for(file_size, proposed_chunk);
        upload.fingerprint = key;
        upload.state = UploadState::Pending;
        upload.created_at = now;
        upload.updated_at = now;

        store_.save_upload(upload);
        uploads_[upload.handle] = upload;
        spdlog::info("Created upload {} for {} ({} bytes, {} chunks)", upload.handle, upload.filename, upload.size,
                     upload.chunk_count);
        return {.upload = upload, .resumed = false};
    }

    bool UploadRegistry::mark_finalized(const std::string &handle, const std::string &artifact)
    {
        std::lock_guard lock(mutex_);
        auto it = uploads_.find(handle);
        if (it == uploads_.end())
        {
            throw UploadError(filedrop::ErrorCode::NotFound, "Unknown upload");
        }
        if (it->second.finalized())
        {
            return true;
        }
        auto updated = it->second;
        updated.state = UploadState::Finalized;
        updated.artifact = artifact;
        updated.updated_at = Clock::now();
        store_.save_upload(updated);
        it->second = std::move(updated);
        return false;
    }

    Upload UploadRegistry::get(const std::string &handle) const
    {
        auto upload = find(handle);
        if (!upload)
        {
            throw UploadError(filedrop::ErrorCode::NotFound, "Unknown upload");
        }
        return *upload;
    }

    std::optional<Upload> UploadRegistry::find(const std::string &handle) const
    {
        std::lock_guard lock(mutex_);
        auto it = uploads_.find(handle);
        if (it != uploads_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    std::string UploadRegistry::generate_handle() const
    {
        auto handle = crypto::random_hex(16);
        while (uploads_.contains(handle))
        {
            handle = crypto::random_hex(16);
        }
        return handle;
    }

} // namespace filedrop::server

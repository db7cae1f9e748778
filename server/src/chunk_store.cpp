#include "filedrop/server/chunk_store.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "filedrop/server/filesystem.hpp"
#include "filedrop/server/upload_types.hpp"

namespace filedrop::server
{

    namespace
    {
        constexpr auto kTrashDir = "_trash";
        constexpr auto kPartExtension = ".part";
        constexpr std::size_t kIndexWidth = 8;

        std::string part_name(std::uint64_t index)
        {
            std::ostringstream oss;
            oss << std::setw(static_cast<int>(kIndexWidth)) << std::setfill('0') << index << kPartExtension;
            return oss.str();
        }

        std::optional<std::uint64_t> parse_part_name(const std::filesystem::path &path)
        {
            if (path.extension() != kPartExtension)
            {
                return std::nullopt;
            }
            const auto stem = path.stem().string();
            std::uint64_t index = 0;
            const auto *begin = stem.data();
            const auto *end = stem.data() + stem.size();
            const auto [ptr, ec] = std::from_chars(begin, end, index);
            if (stem.empty() || ec != std::errc{} || ptr != end)
            {
                return std::nullopt;
            }
            return index;
        }

        void check_handle(const std::string &handle)
        {
            const auto valid = !handle.empty() && std::all_of(handle.begin(), handle.end(), [](unsigned char c)
                                                              { return std::isxdigit(c) != 0; });
            if (!valid)
            {
                throw std::invalid_argument("Malformed upload handle");
            }
        }

    } // namespace

    LocalChunkStore::LocalChunkStore(std::filesystem::path root)
        : root_(std::move(root)), trash_(root_ / kTrashDir)
    {
        std::filesystem::create_directories(trash_);
        // Leftovers from removals interrupted by a restart.
        for (const auto &entry : std::filesystem::directory_iterator(trash_))
        {
            pending_.push_back(entry.path());
        }
        cleanup_thread_ = std::thread([this]
                                      { run_cleanup(); });
    }

    LocalChunkStore::~LocalChunkStore()
    {
        {
            std::lock_guard lock(cleanup_mutex_);
            stopping_ = true;
        }
        cleanup_cv_.notify_all();
        if (cleanup_thread_.joinable())
        {
            cleanup_thread_.join();
        }
    }

    std::filesystem::path LocalChunkStore::upload_dir(const std::string &handle) const
    {
        check_handle(handle);
        return root_ / handle;
    }

    void LocalChunkStore::prepare(const std::string &handle)
    {
        std::error_code ec;
        std::filesystem::create_directories(upload_dir(handle), ec);
        if (ec)
        {
            throw UploadError(filedrop::ErrorCode::StorageError, "Cannot create staging area: " + ec.message());
        }
    }

    void LocalChunkStore::put(const std::string &handle, std::uint64_t index, std::span<const std::byte> data)
    {
        const auto dir = upload_dir(handle);
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec))
        {
            // Retired by a finalize, or never opened on this store.
            throw UploadError(filedrop::ErrorCode::StorageError, "No staging area for upload " + handle);
        }
        write_file_atomically(dir / part_name(index), data);
    }

    std::vector<std::byte> LocalChunkStore::get(const std::string &handle, std::uint64_t index) const
    {
        const auto path = upload_dir(handle) / part_name(index);
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw UploadError(filedrop::ErrorCode::Incomplete, "Chunk " + std::to_string(index) + " is missing");
        }
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            throw UploadError(filedrop::ErrorCode::StorageError, "Cannot stat " + path.string() + ": " + ec.message());
        }
        std::vector<std::byte> data(static_cast<std::size_t>(size));
        in.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(data.size()));
        if (static_cast<std::uint64_t>(in.gcount()) != size)
        {
            throw UploadError(filedrop::ErrorCode::StorageError, "Short read from " + path.string());
        }
        return data;
    }

    std::vector<std::uint64_t> LocalChunkStore::list_present(const std::string &handle) const
    {
        std::vector<std::uint64_t> indices;
        const auto dir = upload_dir(handle);
        std::error_code ec;
        for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
        {
            if (!it->is_regular_file())
            {
                continue;
            }
            if (auto index = parse_part_name(it->path()))
            {
                indices.push_back(*index);
            }
        }
        std::sort(indices.begin(), indices.end());
        return indices;
    }

    void LocalChunkStore::retire(const std::string &handle) noexcept
    {
        try
        {
            const auto dir = upload_dir(handle);
            const auto stamp = std::chrono::duration_cast<std::chrono::seconds>(
                                   std::chrono::system_clock::now().time_since_epoch())
                                   .count();
            auto target = trash_ / (handle + "-" + std::to_string(stamp));
            std::error_code ec;
            std::filesystem::rename(dir, target, ec);
            if (ec)
            {
                spdlog::debug("Could not move staging for {} to trash: {}", handle, ec.message());
                target = dir;
            }
            {
                std::lock_guard lock(cleanup_mutex_);
                pending_.push_back(std::move(target));
            }
            cleanup_cv_.notify_one();
        }
        catch (const std::exception &ex)
        {
            spdlog::debug("Staging cleanup for {} not scheduled: {}", handle, ex.what());
        }
    }

    void LocalChunkStore::drain()
    {
        std::unique_lock lock(cleanup_mutex_);
        drained_cv_.wait(lock, [this]
                         { return pending_.empty() && !busy_; });
    }

    void LocalChunkStore::run_cleanup()
    {
        std::unique_lock lock(cleanup_mutex_);
        while (true)
        {
            cleanup_cv_.wait(lock, [this]
                             { return stopping_ || !pending_.empty(); });
            if (pending_.empty())
            {
                return;
            }
            auto path = std::move(pending_.front());
            pending_.pop_front();
            busy_ = true;
            lock.unlock();

            std::error_code ec;
            std::filesystem::remove_all(path, ec);
            if (ec)
            {
                spdlog::debug("Staging cleanup of {} failed: {}", path.string(), ec.message());
            }

            lock.lock();
            busy_ = false;
            if (pending_.empty())
            {
                drained_cv_.notify_all();
            }
        }
    }

} // namespace filedrop::server

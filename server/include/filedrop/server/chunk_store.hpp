#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace filedrop::server
{

    // Staging area for raw chunk bytes, addressed by (handle, index).
    class ChunkStore
    {
    public:
        virtual ~ChunkStore() = default;

        virtual void prepare(const std::string &handle) = 0;

        // Replaces whatever was stored for the index. Requires prepare()
        // and fails once the upload has been retired.
        virtual void put(const std::string &handle, std::uint64_t index, std::span<const std::byte> data) = 0;

        virtual std::vector<std::byte> get(const std::string &handle, std::uint64_t index) const = 0;

        // Sorted indices that currently have bytes stored.
        virtual std::vector<std::uint64_t> list_present(const std::string &handle) const = 0;

        // Drops all chunks of the upload in the background. Never throws.
        virtual void retire(const std::string &handle) noexcept = 0;
    };

    // <root>/<handle>/<index:08>.part; retired uploads are moved to
    // <root>/_trash before a worker thread deletes them.
    class LocalChunkStore final : public ChunkStore
    {
    public:
        explicit LocalChunkStore(std::filesystem::path root);
        ~LocalChunkStore() override;

        LocalChunkStore(const LocalChunkStore &) = delete;
        LocalChunkStore &operator=(const LocalChunkStore &) = delete;

        void prepare(const std::string &handle) override;
        void put(const std::string &handle, std::uint64_t index, std::span<const std::byte> data) override;
        std::vector<std::byte> get(const std::string &handle, std::uint64_t index) const override;
        std::vector<std::uint64_t> list_present(const std::string &handle) const override;
        void retire(const std::string &handle) noexcept override;

        // Blocks until every scheduled removal has run.
        void drain();

    private:
        std::filesystem::path upload_dir(const std::string &handle) const;
        void run_cleanup();

        std::filesystem::path root_;
        std::filesystem::path trash_;

        std::mutex cleanup_mutex_;
        std::condition_variable cleanup_cv_;
        std::condition_variable drained_cv_;
        std::deque<std::filesystem::path> pending_;
        bool busy_{false};
        bool stopping_{false};
        std::thread cleanup_thread_;
    };

} // namespace filedrop::server

#include <algorithm>
#include <cassert>
#include <cctype>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "filedrop/crypto.hpp"
#include "filedrop/server/chunk_store.hpp"
#include "filedrop/server/config.hpp"
#include "filedrop/server/filesystem.hpp"
#include "filedrop/server/metadata_store.hpp"
#include "filedrop/server/stats_book.hpp"
#include "filedrop/server/timeline.hpp"
#include "filedrop/server/upload_service.hpp"
#include "session_common.hpp"

using namespace filedrop;
using namespace filedrop::server;

namespace
{

    constexpr auto kPayload = "The quick brown fox jumps over the lazy dog";

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path fresh_root(const std::string &name)
    {
        const auto root = std::filesystem::temp_directory_path() / name;
        cleanup_path(root);
        return root;
    }

    UploadServiceOptions options_for(const std::filesystem::path &root)
    {
        return {.root = root, .limits = {.max_file_size = 1024, .max_chunk_size = 16}, .downtime_threshold_seconds = 2.0};
    }

    std::vector<std::byte> bytes_of(std::string_view text)
    {
        std::vector<std::byte> out;
        for (const char ch : text)
        {
            out.push_back(static_cast<std::byte>(ch));
        }
        return out;
    }

    std::span<const std::byte> chunk_of(const std::vector<std::byte> &data, std::uint64_t chunk_size,
                                        std::uint64_t index)
    {
        const auto begin = index * chunk_size;
        const auto length = std::min<std::uint64_t>(chunk_size, data.size() - begin);
        return std::span<const std::byte>(data).subspan(begin, length);
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    bool near(double actual, double expected)
    {
        return std::fabs(actual - expected) < 1e-6;
    }

    template <typename Fn>
    void expect_error(ErrorCode expected, Fn &&fn)
    {
        bool caught = false;
        try
        {
            fn();
        }
        catch (const UploadError &err)
        {
            caught = err.code() == expected;
            if (!caught)
            {
                std::cerr << "Expected " << to_string(expected) << ", got " << to_string(err.code()) << ": "
                          << err.what() << '\n';
            }
        }
        assert(caught);
    }

    // Staging store kept in memory; put() can be made to fail.
    class MemoryChunkStore final : public ChunkStore
    {
    public:
        void prepare(const std::string &) override {}

        void put(const std::string &handle, std::uint64_t index, std::span<const std::byte> data) override
        {
            if (fail_puts)
            {
                throw std::runtime_error("disk full");
            }
            chunks_[handle][index].assign(data.begin(), data.end());
        }

        std::vector<std::byte> get(const std::string &handle, std::uint64_t index) const override
        {
            return chunks_.at(handle).at(index);
        }

        std::vector<std::uint64_t> list_present(const std::string &handle) const override
        {
            std::vector<std::uint64_t> indices;
            if (auto it = chunks_.find(handle); it != chunks_.end())
            {
                for (const auto &entry : it->second)
                {
                    indices.push_back(entry.first);
                }
            }
            return indices;
        }

        void retire(const std::string &handle) noexcept override
        {
            chunks_.erase(handle);
        }

        bool fail_puts{false};

    private:
        std::map<std::string, std::map<std::uint64_t, std::vector<std::byte>>> chunks_;
    };

    // Local staging whose next put() first runs a hook, to interleave
    // another operation between the unlocked checks and the write.
    class HookedChunkStore final : public ChunkStore
    {
    public:
        explicit HookedChunkStore(std::filesystem::path root) : local_(std::move(root)) {}

        void prepare(const std::string &handle) override { local_.prepare(handle); }

        void put(const std::string &handle, std::uint64_t index, std::span<const std::byte> data) override
        {
            if (auto hook = std::exchange(before_put, nullptr))
            {
                hook();
            }
            local_.put(handle, index, data);
        }

        std::vector<std::byte> get(const std::string &handle, std::uint64_t index) const override
        {
            return local_.get(handle, index);
        }

        std::vector<std::uint64_t> list_present(const std::string &handle) const override
        {
            return local_.list_present(handle);
        }

        void retire(const std::string &handle) noexcept override { local_.retire(handle); }

        void drain() { local_.drain(); }

        std::function<void()> before_put;

    private:
        LocalChunkStore local_;
    };

    void test_sanitize_filename()
    {
        assert(sanitize_filename("My Report.pdf") == "My_Report.pdf");
        assert(sanitize_filename("../../etc/passwd") == "etc_passwd");
        assert(sanitize_filename("C:\\Users\\bob\\notes.txt") == "C_Users_bob_notes.txt");
        assert(sanitize_filename("  tabs\tand   spaces  ") == "tabs_and_spaces");
        assert(sanitize_filename("r\xC3\xA9sum\xC3\xA9.pdf") == "rsum.pdf");
        assert(sanitize_filename(".hidden_") == "hidden");
        assert(sanitize_filename("....").starts_with("upload-"));
        assert(sanitize_filename(std::string(400, 'a')).size() == kMaxFilenameLength);
    }

    void test_open_and_resume()
    {
        const auto root = fresh_root("filedrop_open_test");
        {
            UploadService service(options_for(root));
            const auto first = service.open("ABCDEF", "My Report.pdf", 40, 16);
            assert(!first.resumed);
            assert(first.upload.filename == "My_Report.pdf");
            assert(first.upload.chunk_count == 3);
            assert(first.upload.handle.size() == 32);
            assert(first.received_indices.empty());

            // Same identity with a different chunk size keeps the original layout.
            const auto again = service.open("abcdef", "My Report.pdf", 40, 8);
            assert(again.resumed);
            assert(again.upload.handle == first.upload.handle);
            assert(again.upload.chunk_size == 16);
            assert(again.upload.chunk_count == 3);

            const auto other_size = service.open("abcdef", "My Report.pdf", 41, 16);
            assert(!other_size.resumed);
            assert(other_size.upload.handle != first.upload.handle);

            const auto no_checksum = service.open("", "plain.txt", 10, 4);
            assert(no_checksum.upload.fingerprint == "NOCHK:plain.txt:10");
            assert(!no_checksum.upload.has_content_hash());
            assert(service.open("  ", "plain.txt", 10, 4).upload.handle == no_checksum.upload.handle);

            const auto status = service.status(first.upload.handle);
            assert(status.received == 0);
            assert((status.missing == std::vector<std::uint64_t>{0, 1, 2}));
            assert(!status.upload.finalized());
            assert(status.stats.bytes_received == 0);
        }
        cleanup_path(root);
    }

    void test_open_validation()
    {
        const auto root = fresh_root("filedrop_validation_test");
        {
            UploadService service(options_for(root));
            expect_error(ErrorCode::InvalidParameters, [&]
                         { service.open("", "   ", 10, 4); });
            expect_error(ErrorCode::InvalidParameters, [&]
                         { service.open("", "a.bin", 0, 4); });
            expect_error(ErrorCode::InvalidParameters, [&]
                         { service.open("", "a.bin", 10, -1); });
            expect_error(ErrorCode::SizeLimitExceeded, [&]
                         { service.open("", "a.bin", 1025, 4); });
            expect_error(ErrorCode::ChunkSizeLimitExceeded, [&]
                         { service.open("", "a.bin", 100, 17); });

            const auto generated = service.open("", "..", 10, 4);
            assert(generated.upload.filename.starts_with("upload-"));

            expect_error(ErrorCode::NotFound, [&]
                         { service.status("0123456789abcdef0123456789abcdef"); });
            expect_error(ErrorCode::NotFound, [&]
                         { service.finalize("0123456789abcdef0123456789abcdef"); });
        }
        cleanup_path(root);
    }

    void test_chunk_validation_and_idempotence()
    {
        const auto root = fresh_root("filedrop_chunk_test");
        {
            UploadService service(options_for(root));
            const auto data = bytes_of(kPayload);
            const auto opened = service.open("", "fox.txt", static_cast<std::int64_t>(data.size()), 16);
            const auto &handle = opened.upload.handle;

            expect_error(ErrorCode::NotFound, [&]
                         { service.put_chunk("ffffffffffffffffffffffffffffffff", 0, chunk_of(data, 16, 0)); });
            expect_error(ErrorCode::IndexOutOfRange, [&]
                         { service.put_chunk(handle, 3, chunk_of(data, 16, 0)); });
            expect_error(ErrorCode::IndexOutOfRange, [&]
                         { service.put_chunk(handle, -1, chunk_of(data, 16, 0)); });
            expect_error(ErrorCode::EmptyBody, [&]
                         { service.put_chunk(handle, 0, {}); });

            const auto first = service.put_chunk(handle, 0, chunk_of(data, 16, 0));
            assert(!first.duplicate);
            assert(first.bytes == 16);
            const auto repeat = service.put_chunk(handle, 0, chunk_of(data, 16, 0));
            assert(repeat.duplicate);

            const auto status = service.status(handle);
            assert(status.received == 1);
            assert(status.stats.bytes_received == 16);
            assert(status.stats.current_concurrency == 0);
            assert(status.stats.peak_concurrency >= 1);
            assert((status.missing == std::vector<std::uint64_t>{1, 2}));
        }
        cleanup_path(root);
    }

    void test_out_of_order_round_trip()
    {
        const auto root = fresh_root("filedrop_roundtrip_test");
        {
            auto staging = std::make_unique<LocalChunkStore>(root / "staging");
            auto *staging_ptr = staging.get();
            UploadService service(options_for(root), std::move(staging));

            const auto data = bytes_of(kPayload);
            const auto checksum = crypto::sha256_bytes(data);
            std::string upper = checksum;
            std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c)
                           { return static_cast<char>(std::toupper(c)); });
            const auto opened = service.open(upper, "fox.txt", static_cast<std::int64_t>(data.size()), 16);
            const auto &handle = opened.upload.handle;

            for (const std::int64_t index : {2, 0, 1})
            {
                service.put_chunk(handle, index, chunk_of(data, 16, static_cast<std::uint64_t>(index)));
            }

            const auto result = service.finalize(handle);
            assert(!result.already);
            assert(result.artifact == "fox.txt");
            assert(read_file(result.path) == kPayload);
            assert(result.stats.bytes_received == data.size());
            assert(result.stats.upload_start);
            assert(result.stats.finalized_at);
            assert(result.stats.peak_concurrency >= 1);
            assert(result.stats.assembly_seconds >= 0.0);

            const auto status = service.status(handle);
            assert(status.upload.finalized());
            assert(status.upload.artifact == std::optional<std::string>("fox.txt"));
            assert(status.missing.empty());

            const auto again = service.finalize(handle);
            assert(again.already);
            assert(again.artifact == result.artifact);

            expect_error(ErrorCode::AlreadyFinalized, [&]
                         { service.put_chunk(handle, 0, chunk_of(data, 16, 0)); });

            staging_ptr->drain();
            assert(!std::filesystem::exists(root / "staging" / handle));

            const auto info = service.fetch_info("fox.txt");
            assert(info.size == data.size());
            const auto range = service.fetch_range("fox.txt", 4, 5);
            assert((range == bytes_of("quick")));
            assert(service.fetch_range("fox.txt", data.size(), 0).empty());
            expect_error(ErrorCode::InvalidParameters, [&]
                         { service.fetch_range("fox.txt", data.size() + 1, 0); });
            expect_error(ErrorCode::NotFound, [&]
                         { service.fetch_info("missing.txt"); });

            // A finalized upload is never resumed; the same file starts over.
            const auto reopened = service.open(checksum, "fox.txt", static_cast<std::int64_t>(data.size()), 16);
            assert(!reopened.resumed);
            assert(reopened.upload.handle != handle);
        }
        cleanup_path(root);
    }

    void test_completeness_gate()
    {
        const auto root = fresh_root("filedrop_incomplete_test");
        {
            UploadService service(options_for(root));
            const auto data = bytes_of(kPayload);
            const auto handle = service.open("", "gap.txt", static_cast<std::int64_t>(data.size()), 16).upload.handle;
            service.put_chunk(handle, 0, chunk_of(data, 16, 0));
            service.put_chunk(handle, 2, chunk_of(data, 16, 2));

            expect_error(ErrorCode::Incomplete, [&]
                         { service.finalize(handle); });
            const auto status = service.status(handle);
            assert(!status.upload.finalized());
            assert((status.missing == std::vector<std::uint64_t>{1}));
            assert(std::filesystem::is_empty(root / "uploads"));

            service.put_chunk(handle, 1, chunk_of(data, 16, 1));
            assert(read_file(service.finalize(handle).path) == kPayload);
        }
        cleanup_path(root);
    }

    void test_integrity_failures()
    {
        const auto root = fresh_root("filedrop_integrity_test");
        {
            UploadService service(options_for(root));
            const auto data = bytes_of(kPayload);
            const auto handle = service.open(crypto::sha256_bytes(data), "fox.txt",
                                             static_cast<std::int64_t>(data.size()), 16)
                                    .upload.handle;
            service.put_chunk(handle, 0, chunk_of(data, 16, 0));
            service.put_chunk(handle, 1, bytes_of("corrupted bytes!"));
            service.put_chunk(handle, 2, chunk_of(data, 16, 2));

            expect_error(ErrorCode::ChecksumMismatch, [&]
                         { service.finalize(handle); });
            assert(!service.status(handle).upload.finalized());
            assert(std::filesystem::is_empty(root / "uploads"));

            // Resending the damaged chunk makes the same upload finalizable.
            service.put_chunk(handle, 1, chunk_of(data, 16, 1));
            assert(read_file(service.finalize(handle).path) == kPayload);
            assert(service.status(handle).stats.bytes_received == data.size());

            // Declared size larger than what the chunks hold.
            const auto short_handle = service.open("", "short.txt", 40, 16).upload.handle;
            service.put_chunk(short_handle, 0, chunk_of(data, 16, 0));
            service.put_chunk(short_handle, 1, chunk_of(data, 16, 1));
            service.put_chunk(short_handle, 2, bytes_of("tiny"));
            expect_error(ErrorCode::SizeMismatch, [&]
                         { service.finalize(short_handle); });
            assert(!service.status(short_handle).upload.finalized());
            assert(std::filesystem::is_empty(root / "assembling"));

            // Overwriting the last chunk with the right bytes repairs it.
            service.put_chunk(short_handle, 2, bytes_of("12345678"));
            const auto repaired = service.finalize(short_handle);
            assert(read_file(repaired.path).size() == 40);
            assert(repaired.stats.bytes_received == 40);
        }
        cleanup_path(root);
    }

    void test_artifact_collision()
    {
        const auto root = fresh_root("filedrop_collision_test");
        {
            UploadService service(options_for(root));
            const auto first = service.open("", "dup.txt", 3, 16).upload.handle;
            service.put_chunk(first, 0, bytes_of("one"));
            assert(service.finalize(first).artifact == "dup.txt");

            const auto second = service.open("", "dup.txt", 3, 16).upload.handle;
            assert(second != first);
            service.put_chunk(second, 0, bytes_of("two"));
            const auto result = service.finalize(second);
            assert(result.artifact == "dup-" + second + ".txt");
            assert(read_file(root / "uploads" / "dup.txt") == "one");
            assert(read_file(result.path) == "two");
        }
        cleanup_path(root);
    }

    void test_work_file_suffix_survives_restart()
    {
        const auto root = fresh_root("filedrop_suffix_test");
        {
            UploadService service(options_for(root));
            const auto handle = service.open("", "x.assembling", 5, 16).upload.handle;
            service.put_chunk(handle, 0, bytes_of("kept!"));
            assert(service.finalize(handle).artifact == "x.assembling");
        }
        {
            // Stale work from an interrupted assembly is still discarded.
            std::ofstream stale(root / "assembling" / "0123456789abcdef0123456789abcdef.assembling");
            stale << "partial";
        }
        {
            UploadService service(options_for(root));
            assert(service.fetch_info("x.assembling").size == 5);
            assert(read_file(root / "uploads" / "x.assembling") == "kept!");
            assert(std::filesystem::is_empty(root / "assembling"));
        }
        cleanup_path(root);
    }

    void test_write_racing_finalize()
    {
        const auto root = fresh_root("filedrop_race_test");
        {
            auto staging = std::make_unique<HookedChunkStore>(root / "staging");
            auto *hooked = staging.get();
            UploadService service(options_for(root), std::move(staging));
            const auto data = bytes_of("0123456789abcdefWXYZ");
            const auto handle = service.open("", "race.bin", 20, 16).upload.handle;
            service.put_chunk(handle, 0, chunk_of(data, 16, 0));
            service.put_chunk(handle, 1, chunk_of(data, 16, 1));

            // The finalize lands after the resend passed its unlocked checks.
            hooked->before_put = [&]
            { service.finalize(handle); };
            expect_error(ErrorCode::AlreadyFinalized, [&]
                         { service.put_chunk(handle, 0, chunk_of(data, 16, 0)); });

            hooked->drain();
            assert(!std::filesystem::exists(root / "staging" / handle));
            assert(hooked->list_present(handle).empty());
            const auto status = service.status(handle);
            assert(status.upload.finalized());
            assert(status.stats.current_concurrency == 0);
            assert(read_file(root / "uploads" / "race.bin") == "0123456789abcdefWXYZ");
        }
        cleanup_path(root);
    }

    void test_final_bytes_match_artifact()
    {
        const auto root = fresh_root("filedrop_final_bytes_test");
        {
            auto staging = std::make_unique<MemoryChunkStore>();
            auto *memory = staging.get();
            UploadService service(options_for(root), std::move(staging));
            const auto handle = service.open("", "late.bin", 20, 16).upload.handle;
            service.put_chunk(handle, 0, bytes_of("0123456789abcdef"));
            // Stored, but its ledger update never happened.
            memory->put(handle, 1, bytes_of("WXYZ"));
            assert(service.status(handle).stats.bytes_received == 16);

            const auto result = service.finalize(handle);
            assert(read_file(result.path) == "0123456789abcdefWXYZ");
            assert(result.stats.bytes_received == 20);
            assert(service.status(handle).stats.bytes_received == 20);
        }
        cleanup_path(root);
    }

    void test_resume_after_restart()
    {
        const auto root = fresh_root("filedrop_restart_test");
        const auto data = bytes_of(kPayload);
        std::string handle;
        {
            UploadService service(options_for(root));
            handle = service.open("", "fox.txt", static_cast<std::int64_t>(data.size()), 16).upload.handle;
            service.put_chunk(handle, 0, chunk_of(data, 16, 0));
            service.put_chunk(handle, 1, chunk_of(data, 16, 1));
        }
        {
            // Simulate a write torn by a crash.
            std::ofstream journal(root / "state" / "ledger" / (handle + ".jsonl"), std::ios::app);
            journal << "{\"index\": 2, \"sta";
        }
        {
            UploadService service(options_for(root));
            const auto resumed = service.open("", "fox.txt", static_cast<std::int64_t>(data.size()), 8);
            assert(resumed.resumed);
            assert(resumed.upload.handle == handle);
            assert((resumed.received_indices == std::vector<std::uint64_t>{0, 1}));
            assert(service.status(handle).stats.bytes_received == 32);

            service.put_chunk(handle, 2, chunk_of(data, 16, 2));
            assert(read_file(service.finalize(handle).path) == kPayload);
        }
        {
            UploadService service(options_for(root));
            const auto status = service.status(handle);
            assert(status.upload.finalized());
            assert(status.received == 3);
            assert(status.stats.finalized_at);
        }
        cleanup_path(root);
    }

    void test_parallel_chunks()
    {
        const auto root = fresh_root("filedrop_parallel_test");
        {
            UploadService service(options_for(root));
            std::string text;
            for (int i = 0; i < 40; ++i)
            {
                text += "line " + std::to_string(i) + "\n";
            }
            const auto data = bytes_of(text);
            const auto handle =
                service.open(crypto::sha256_bytes(data), "lines.txt", static_cast<std::int64_t>(data.size()), 16)
                    .upload.handle;
            const auto chunk_count = service.status(handle).upload.chunk_count;

            std::vector<std::thread> workers;
            for (std::uint64_t worker = 0; worker < 4; ++worker)
            {
                workers.emplace_back([&, worker]
                                     {
                    for (std::uint64_t index = worker; index < chunk_count; index += 4)
                    {
                        service.put_chunk(handle, static_cast<std::int64_t>(index), chunk_of(data, 16, index));
                    } });
            }
            for (auto &worker : workers)
            {
                worker.join();
            }

            const auto status = service.status(handle);
            assert(status.missing.empty());
            assert(status.stats.bytes_received == data.size());
            assert(status.stats.current_concurrency == 0);

            const auto result = service.finalize(handle);
            assert(read_file(result.path) == text);
            assert(result.stats.peak_concurrency >= 1);
        }
        cleanup_path(root);
    }

    void test_storage_failure_rolls_back()
    {
        const auto root = fresh_root("filedrop_storage_test");
        {
            auto staging = std::make_unique<MemoryChunkStore>();
            auto *memory = staging.get();
            UploadService service(options_for(root), std::move(staging));
            const auto handle = service.open("", "mem.bin", 20, 16).upload.handle;

            memory->fail_puts = true;
            expect_error(ErrorCode::StorageError, [&]
                         { service.put_chunk(handle, 0, bytes_of("0123456789abcdef")); });
            const auto status = service.status(handle);
            assert(status.received == 0);
            assert(status.stats.bytes_received == 0);
            assert(status.stats.current_concurrency == 0);

            memory->fail_puts = false;
            service.put_chunk(handle, 0, bytes_of("0123456789abcdef"));
            service.put_chunk(handle, 1, bytes_of("WXYZ"));
            const auto result = service.finalize(handle);
            assert(read_file(result.path) == "0123456789abcdefWXYZ");
            assert(memory->list_present(handle).empty());
        }
        cleanup_path(root);
    }

    void test_timeline()
    {
        const auto base = Timestamp{} + std::chrono::seconds(1'700'000'000);
        const auto at = [&](double seconds)
        {
            return base + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
        };
        const auto event = [&](std::uint64_t index, double start, double end)
        {
            return ChunkEvent{.index = index, .start = at(start), .end = at(end), .bytes = 1};
        };

        const std::vector<ChunkEvent> overlapping = {event(0, 0, 5), event(1, 3, 8), event(2, 10, 12)};
        const auto summary = reconstruct_timeline(overlapping);
        assert(summary.upload_start == at(0));
        assert(summary.upload_end == at(12));
        assert(near(summary.active_seconds, 10.0));
        assert(near(summary.downtime_seconds, 2.0));
        assert(summary.peak_concurrency == 2);
        assert(summary.bytes == 3);
        assert(near(summary.concurrency_seconds, 12.0));
        assert(summary.average_concurrency && near(*summary.average_concurrency, 1.2));

        const std::vector<ChunkEvent> shuffled = {overlapping[2], overlapping[0], overlapping[1]};
        const auto reordered = reconstruct_timeline(shuffled);
        assert(near(reordered.active_seconds, summary.active_seconds));
        assert(reordered.peak_concurrency == summary.peak_concurrency);

        const std::vector<ChunkEvent> touching = {event(0, 0, 2), event(1, 2, 4)};
        const auto chained = reconstruct_timeline(touching);
        assert(chained.peak_concurrency == 1);
        assert(near(chained.active_seconds, 4.0));
        assert(near(chained.downtime_seconds, 0.0));

        const std::vector<ChunkEvent> reversed = {event(0, 5, 3)};
        const auto clamped = reconstruct_timeline(reversed);
        assert(near(clamped.active_seconds, 0.0));
        assert(clamped.peak_concurrency == 1);
        assert(clamped.upload_start == at(5));
        assert(!clamped.average_concurrency);

        const auto empty = reconstruct_timeline({});
        assert(!empty.upload_start);
        assert(!empty.upload_end);
        assert(empty.peak_concurrency == 0);
        assert(near(empty.active_seconds, 0.0));
        assert(!empty.average_concurrency);
    }

    void test_incremental_stats()
    {
        const auto root = fresh_root("filedrop_stats_test");
        {
            MetadataStore store(root / "state");
            StatsBook stats(store, 2.0);
            const auto base = Timestamp{} + std::chrono::seconds(1'700'000'000);
            const auto at = [&](int ms)
            { return base + std::chrono::milliseconds(ms); };

            stats.ensure("aa");
            stats.record_chunk("aa", {.index = 0, .start = at(0), .end = at(1000), .bytes = 10}, false);
            stats.record_chunk("aa", {.index = 1, .start = at(1500), .end = at(2500), .bytes = 10}, false);
            stats.record_chunk("aa", {.index = 2, .start = at(10000), .end = at(11000), .bytes = 10}, false);
            stats.record_chunk("aa", {.index = 2, .start = at(11000), .end = at(11500), .bytes = 10}, true);

            const auto snapshot = stats.get("aa");
            assert(snapshot.bytes_received == 30);
            assert(near(snapshot.active_seconds, 4.0));
            assert(near(snapshot.downtime_seconds, 7.5));
            assert(snapshot.first_activity == at(0));
            assert(snapshot.last_activity_end == at(11500));
            assert(snapshot.average_upload_bps() && near(*snapshot.average_upload_bps(), 7.5));

            const auto reported = session_common::to_snapshot(snapshot);
            assert(reported.upload_start == format_iso8601(at(0)));
            assert(reported.upload_end == format_iso8601(at(11500)));
            assert(!reported.finalized_at);

            stats.begin_write("aa", at(20000));
            stats.begin_write("aa", at(20000));
            assert(stats.get("aa").current_concurrency == 2);
            stats.end_write("aa", at(21000));
            stats.end_write("aa", at(22000));
            const auto live = stats.get("aa");
            assert(live.current_concurrency == 0);
            assert(live.peak_concurrency == 2);
            assert(near(live.concurrency_seconds, 3.0));
        }
        {
            MetadataStore store(root / "state");
            StatsBook reloaded(store, 2.0);
            assert(reloaded.get("aa").bytes_received == 30);
            assert(reloaded.get("aa").current_concurrency == 0);
        }
        cleanup_path(root);
    }

    void test_schema_migration()
    {
        const auto root = fresh_root("filedrop_migration_test");
        const auto state = root / "state";
        std::filesystem::create_directories(state / "uploads");
        std::filesystem::create_directories(state / "ledger");
        std::filesystem::create_directories(state / "stats");
        {
            std::ofstream(state / "schema.json") << R"({"version": 1})";
            std::ofstream(state / "stats" / "abcd.json")
                << R"({"bytes_received": 5, "active_seconds": 1.5, "downtime_seconds": 0.0})";
        }
        {
            MetadataStore store(state);
            assert(store.schema_version() == MetadataStore::kSchemaVersion);

            std::ifstream in(state / "stats" / "abcd.json");
            const auto row = nlohmann::json::parse(in);
            assert(row.at("peak_concurrency") == 0);
            assert(row.contains("concurrency_seconds"));

            const auto stats = store.load_stats();
            assert(stats.at("abcd").bytes_received == 5);
            assert(near(stats.at("abcd").active_seconds, 1.5));
        }
        {
            std::ifstream in(state / "schema.json");
            assert(nlohmann::json::parse(in).at("version") == 2);
        }
        {
            std::ofstream(state / "schema.json", std::ios::trunc) << R"({"version": 99})";
        }
        bool rejected = false;
        try
        {
            MetadataStore newer(state);
        }
        catch (const std::runtime_error &)
        {
            rejected = true;
        }
        assert(rejected);
        cleanup_path(root);
    }

    struct Argv
    {
        explicit Argv(std::vector<std::string> args) : storage(std::move(args))
        {
            for (auto &arg : storage)
            {
                pointers.push_back(arg.data());
            }
        }

        int argc() const { return static_cast<int>(pointers.size()); }
        char **argv() { return pointers.data(); }

        std::vector<std::string> storage;
        std::vector<char *> pointers;
    };

    void test_config()
    {
        ServerConfig defaults;
        assert(defaults.port == 8000);
        assert(defaults.address == "0.0.0.0");
        assert(defaults.root == std::filesystem::path("data"));
        assert(defaults.max_file_size == 50ULL * 1024 * 1024 * 1024);
        assert(defaults.max_chunk_size == 64ULL * 1024 * 1024);
        assert(near(defaults.downtime_threshold_seconds, 2.0));
        assert(defaults.max_frame_size() > defaults.max_chunk_size * 4 / 3);

        const std::map<std::string, std::string> env = {
            {"FILEDROP_PORT", "9000"},
            {"FILEDROP_ROOT", "/srv/drop"},
            {"FILEDROP_MAX_CHUNK_SIZE", "1024"},
            {"FILEDROP_DOWNTIME_THRESHOLD", "3.5"},
            {"FILEDROP_LOG", "drop.log"},
        };
        const auto lookup = [&](std::string_view name) -> std::optional<std::string>
        {
            if (auto it = env.find(std::string(name)); it != env.end())
            {
                return it->second;
            }
            return std::nullopt;
        };

        ServerConfig config;
        apply_environment(config, lookup);
        assert(config.port == 9000);
        assert(config.root == std::filesystem::path("/srv/drop"));
        assert(config.max_chunk_size == 1024);
        assert(near(config.downtime_threshold_seconds, 3.5));
        assert(config.log_file == std::optional<std::filesystem::path>("drop.log"));
        assert(config.max_frame_size() == 1368 + 64 * 1024);

        Argv args({"filedrop_server", "--port", "9100", "--log-level", "debug", "--threads", "3"});
        assert(apply_arguments(config, args.argc(), args.argv()) == ArgumentsOutcome::Run);
        assert(config.port == 9100);
        assert(config.log_level == "debug");
        assert(config.worker_threads == 3);
        assert(config.root == std::filesystem::path("/srv/drop"));

        const auto options = config.service_options();
        assert(options.limits.max_chunk_size == 1024);
        assert(near(options.downtime_threshold_seconds, 3.5));

        Argv help({"filedrop_server", "--help"});
        assert(apply_arguments(config, help.argc(), help.argv()) == ArgumentsOutcome::ShowHelp);

        const auto rejects = [](std::vector<std::string> argv)
        {
            ServerConfig scratch;
            Argv args(std::move(argv));
            bool caught = false;
            try
            {
                apply_arguments(scratch, args.argc(), args.argv());
            }
            catch (const ConfigError &)
            {
                caught = true;
            }
            return caught;
        };
        assert(rejects({"filedrop_server", "--port"}));
        assert(rejects({"filedrop_server", "--port", "70000"}));
        assert(rejects({"filedrop_server", "--port", "80a"}));
        assert(rejects({"filedrop_server", "--max-chunk-size", "0"}));
        assert(rejects({"filedrop_server", "--downtime-threshold", "-1"}));
        assert(rejects({"filedrop_server", "--log-level", "loud"}));
        assert(rejects({"filedrop_server", "--bogus"}));

        bool env_rejected = false;
        try
        {
            ServerConfig scratch;
            apply_environment(scratch, [](std::string_view name) -> std::optional<std::string>
                              { return name == "FILEDROP_PORT" ? std::optional<std::string>("eighty") : std::nullopt; });
        }
        catch (const ConfigError &)
        {
            env_rejected = true;
        }
        assert(env_rejected);

        assert(usage("filedrop_server").find("--downtime-threshold") != std::string::npos);
    }

} // namespace

void run_server_component_tests()
{
    test_sanitize_filename();
    test_open_and_resume();
    test_open_validation();
    test_chunk_validation_and_idempotence();
    test_out_of_order_round_trip();
    test_completeness_gate();
    test_integrity_failures();
    test_artifact_collision();
    test_work_file_suffix_survives_restart();
    test_write_racing_finalize();
    test_final_bytes_match_artifact();
    test_resume_after_restart();
    test_parallel_chunks();
    test_storage_failure_rolls_back();
    test_timeline();
    test_incremental_stats();
    test_schema_migration();
    test_config();
}

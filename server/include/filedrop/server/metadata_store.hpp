#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "filedrop/server/upload_types.hpp"

namespace filedrop::server
{

    // One line of a ledger journal. An empty event drops the index again.
    struct LedgerRecord
    {
        std::uint64_t index{};
        std::optional<ChunkEvent> event;
    };

    // Durable JSON state under <root>/state:
    //   uploads/<handle>.json   one upload row
    //   ledger/<handle>.jsonl   append-only journal, later records win
    //   stats/<handle>.json     one stats row
    //   schema.json             {"version": N}
    // Not synchronized; callers serialize access per upload.
    class MetadataStore
    {
    public:
        static constexpr int kSchemaVersion = 2;

        explicit MetadataStore(std::filesystem::path state_root);

        int schema_version() const noexcept { return version_; }

        std::vector<Upload> load_uploads() const;
        void save_upload(const Upload &upload) const;

        std::unordered_map<std::string, std::vector<LedgerRecord>> load_ledgers() const;
        void append_ledger(const std::string &handle, const LedgerRecord &record) const;

        std::unordered_map<std::string, UploadStats> load_stats() const;
        void save_stats(const std::string &handle, const UploadStats &stats) const;

    private:
        void migrate();
        void write_version(int version);

        std::filesystem::path root_;
        std::filesystem::path uploads_dir_;
        std::filesystem::path ledger_dir_;
        std::filesystem::path stats_dir_;
        int version_{0};
    };

} // namespace filedrop::server

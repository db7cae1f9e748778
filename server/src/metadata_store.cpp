#include "filedrop/server/metadata_store.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "filedrop/server/filesystem.hpp"

namespace filedrop::server
{

    namespace
    {
        constexpr auto kUploadsDir = "uploads";
        constexpr auto kLedgerDir = "ledger";
        constexpr auto kStatsDir = "stats";
        constexpr auto kSchemaFile = "schema.json";

        template <typename T>
        void put_time(nlohmann::json &json, const char *key, const std::optional<T> &value)
        {
            if (value)
            {
                json[key] = to_epoch_ms(*value);
            }
        }

        std::optional<Timestamp> read_time(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && it->is_number_integer())
            {
                return from_epoch_ms(it->get<std::int64_t>());
            }
            return std::nullopt;
        }

        nlohmann::json to_json(const Upload &upload)
        {
            nlohmann::json json = {
                {"upload_id", upload.handle},
                {"filename", upload.filename},
                {"size", upload.size},
                {"chunk_size", upload.chunk_size},
                {"total_chunks", upload.chunk_count},
                {"checksum", upload.fingerprint},
                {"finalized", upload.finalized()},
                {"created_at", to_epoch_ms(upload.created_at)},
                {"updated_at", to_epoch_ms(upload.updated_at)},
            };
            if (upload.artifact)
            {
                json["artifact"] = *upload.artifact;
            }
            return json;
        }

        Upload upload_from_json(const nlohmann::json &json)
        {
            Upload upload{};
            upload.handle = json.at("upload_id").get<std::string>();
            upload.filename = json.at("filename").get<std::string>();
            upload.size = json.at("size").get<std::uint64_t>();
            upload.chunk_size = json.at("chunk_size").get<std::uint64_t>();
            upload.chunk_count = json.value("total_chunks", chunk_count_for(upload.size, upload.chunk_size));
            upload.fingerprint = json.value("checksum", std::string{});
            upload.state = json.value("finalized", false) ? UploadState::Finalized : UploadState::Pending;
            upload.created_at = from_epoch_ms(json.value("created_at", std::int64_t{0}));
            upload.updated_at = from_epoch_ms(json.value("updated_at", std::int64_t{0}));
            if (auto it = json.find("artifact"); it != json.end() && it->is_string())
            {
                upload.artifact = it->get<std::string>();
            }
            return upload;
        }

        nlohmann::json to_json(const LedgerRecord &record)
        {
            nlohmann::json json = {{"index", record.index}};
            if (record.event)
            {
                json["start"] = to_epoch_ms(record.event->start);
                json["end"] = to_epoch_ms(record.event->end);
                json["bytes"] = record.event->bytes;
            }
            else
            {
                json["dropped"] = true;
            }
            return json;
        }

        LedgerRecord ledger_record_from_json(const nlohmann::json &json)
        {
            LedgerRecord record{};
            record.index = json.at("index").get<std::uint64_t>();
            if (!json.value("dropped", false))
            {
                record.event = ChunkEvent{
                    .index = record.index,
                    .start = from_epoch_ms(json.at("start").get<std::int64_t>()),
                    .end = from_epoch_ms(json.at("end").get<std::int64_t>()),
                    .bytes = json.value("bytes", 0ULL),
                };
            }
            return record;
        }

        nlohmann::json to_json(const UploadStats &stats)
        {
            nlohmann::json json = {
                {"bytes_received", stats.bytes_received},
                {"active_seconds", stats.active_seconds},
                {"downtime_seconds", stats.downtime_seconds},
                {"assembly_seconds", stats.assembly_seconds},
                {"peak_concurrency", stats.peak_concurrency},
                {"concurrency_seconds", stats.concurrency_seconds},
            };
            put_time(json, "first_activity", stats.first_activity);
            put_time(json, "last_activity_end", stats.last_activity_end);
            put_time(json, "upload_start", stats.upload_start);
            put_time(json, "upload_end", stats.upload_end);
            put_time(json, "finalized_at", stats.finalized_at);
            return json;
        }

        UploadStats stats_from_json(const nlohmann::json &json)
        {
            UploadStats stats{};
            stats.bytes_received = json.value("bytes_received", 0ULL);
            stats.active_seconds = json.value("active_seconds", 0.0);
            stats.downtime_seconds = json.value("downtime_seconds", 0.0);
            stats.assembly_seconds = json.value("assembly_seconds", 0.0);
            stats.peak_concurrency = json.value("peak_concurrency", 0u);
            stats.concurrency_seconds = json.value("concurrency_seconds", 0.0);
            stats.first_activity = read_time(json, "first_activity");
            stats.last_activity_end = read_time(json, "last_activity_end");
            stats.upload_start = read_time(json, "upload_start");
            stats.upload_end = read_time(json, "upload_end");
            stats.finalized_at = read_time(json, "finalized_at");
            return stats;
        }

        nlohmann::json read_json_file(const std::filesystem::path &path)
        {
            std::ifstream in(path);
            if (!in.is_open())
            {
                throw std::runtime_error("Cannot open " + path.string());
            }
            return nlohmann::json::parse(in);
        }

        // Handle is the file stem for every table.
        template <typename Fn>
        void for_each_file(const std::filesystem::path &dir, const char *extension, Fn &&fn)
        {
            for (const auto &entry : std::filesystem::directory_iterator(dir))
            {
                if (!entry.is_regular_file() || entry.path().extension() != extension)
                {
                    continue;
                }
                try
                {
                    fn(entry.path());
                }
                catch (const std::exception &ex)
                {
                    spdlog::warn("Skipping unreadable state file {}: {}", entry.path().string(), ex.what());
                }
            }
        }

    } // namespace

    MetadataStore::MetadataStore(std::filesystem::path state_root)
        : root_(std::move(state_root)),
          uploads_dir_(root_ / kUploadsDir),
          ledger_dir_(root_ / kLedgerDir),
          stats_dir_(root_ / kStatsDir)
    {
        std::filesystem::create_directories(root_);
        migrate();
    }

    void MetadataStore::migrate()
    {
        const auto schema_path = root_ / kSchemaFile;
        if (std::filesystem::exists(schema_path))
        {
            version_ = read_json_file(schema_path).value("version", 0);
        }
        if (version_ > kSchemaVersion)
        {
            throw std::runtime_error("State schema version " + std::to_string(version_) +
                                     " is newer than supported version " + std::to_string(kSchemaVersion));
        }

        if (version_ < 1)
        {
            std::filesystem::create_directories(uploads_dir_);
            std::filesystem::create_directories(ledger_dir_);
            std::filesystem::create_directories(stats_dir_);
            write_version(1);
        }

        if (version_ < 2)
        {
            // Version 1 stats rows predate concurrency tracking.
            std::size_t updated = 0;
            for_each_file(stats_dir_, ".json", [&](const std::filesystem::path &path)
                          {
                auto json = read_json_file(path);
                bool changed = false;
                if (!json.contains("peak_concurrency"))
                {
                    json["peak_concurrency"] = 0;
                    changed = true;
                }
                if (!json.contains("concurrency_seconds"))
                {
                    json["concurrency_seconds"] = 0.0;
                    changed = true;
                }
                if (changed)
                {
                    write_file_atomically(path, json.dump(2));
                    ++updated;
                } });
            spdlog::info("Migrated state schema to version 2 ({} stats rows updated)", updated);
            write_version(2);
        }
    }

    void MetadataStore::write_version(int version)
    {
        write_file_atomically(root_ / kSchemaFile, nlohmann::json{{"version", version}}.dump());
        version_ = version;
    }

    std::vector<Upload> MetadataStore::load_uploads() const
    {
        std::vector<Upload> uploads;
        for_each_file(uploads_dir_, ".json", [&](const std::filesystem::path &path)
                      { uploads.push_back(upload_from_json(read_json_file(path))); });
        return uploads;
    }

    void MetadataStore::save_upload(const Upload &upload) const
    {
        write_file_atomically(uploads_dir_ / (upload.handle + ".json"), to_json(upload).dump(2));
    }

    std::unordered_map<std::string, std::vector<LedgerRecord>> MetadataStore::load_ledgers() const
    {
        std::unordered_map<std::string, std::vector<LedgerRecord>> ledgers;
        for_each_file(ledger_dir_, ".jsonl", [&](const std::filesystem::path &path)
                      {
            std::ifstream in(path);
            if (!in.is_open())
            {
                throw std::runtime_error("Cannot open ledger journal");
            }
            auto &records = ledgers[path.stem().string()];
            std::string line;
            std::size_t line_number = 0;
            bool terminated = true;
            while (std::getline(in, line))
            {
                ++line_number;
                terminated = !in.eof();
                if (line.empty())
                {
                    continue;
                }
                try
                {
                    records.push_back(ledger_record_from_json(nlohmann::json::parse(line)));
                }
                catch (const std::exception &ex)
                {
                    // A torn trailing write after a crash leaves a partial line.
                    spdlog::warn("Ignoring ledger record {}:{}: {}", path.string(), line_number, ex.what());
                }
            }
            if (!terminated)
            {
                // Keep the next append on a line of its own.
                std::ofstream repair(path, std::ios::app);
                repair << '\n';
            } });
        return ledgers;
    }

    void MetadataStore::append_ledger(const std::string &handle, const LedgerRecord &record) const
    {
        const auto path = ledger_dir_ / (handle + ".jsonl");
        std::ofstream out(path, std::ios::app);
        if (!out.is_open())
        {
            throw UploadError(filedrop::ErrorCode::StorageError, "Cannot open ledger journal " + path.string());
        }
        out << to_json(record).dump() << '\n';
        out.flush();
        if (!out)
        {
            throw UploadError(filedrop::ErrorCode::StorageError, "Ledger append failed for " + path.string());
        }
    }

    std::unordered_map<std::string, UploadStats> MetadataStore::load_stats() const
    {
        std::unordered_map<std::string, UploadStats> stats;
        for_each_file(stats_dir_, ".json", [&](const std::filesystem::path &path)
                      { stats[path.stem().string()] = stats_from_json(read_json_file(path)); });
        return stats;
    }

    void MetadataStore::save_stats(const std::string &handle, const UploadStats &stats) const
    {
        write_file_atomically(stats_dir_ / (handle + ".json"), to_json(stats).dump(2));
    }

} // namespace filedrop::server

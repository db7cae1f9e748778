#include "filedrop/protocol.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace filedrop::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 7> kCommandMappings{{
            {Command::OpenUpload, "OPEN_UPLOAD"},
            {Command::PutChunk, "PUT_CHUNK"},
            {Command::GetStatus, "GET_STATUS"},
            {Command::Finalize, "FINALIZE"},
            {Command::FetchInit, "FETCH_INIT"},
            {Command::FetchChunk, "FETCH_CHUNK"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        template <typename T>
        void put_optional(nlohmann::json &json, const char *key, const std::optional<T> &value)
        {
            if (value)
            {
                json[key] = *value;
            }
        }

        template <typename T>
        std::optional<T> read_optional(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<T>();
            }
            return std::nullopt;
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        put_optional(json, "id", envelope.request_id);
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = read_optional<std::string>(json, "id");
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        put_optional(json, "id", envelope.request_id);
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = read_optional<std::string>(json, "id");
    }

    void to_json(nlohmann::json &json, const OpenUploadRequest &request)
    {
        json = {
            {"checksum", request.checksum},
            {"filename", request.filename},
            {"size", request.size},
            {"chunk_size", request.chunk_size},
        };
    }

    void from_json(const nlohmann::json &json, OpenUploadRequest &request)
    {
        request.checksum = json.value("checksum", std::string{});
        request.filename = json.value("filename", std::string{});
        request.size = json.value("size", std::int64_t{0});
        request.chunk_size = json.value("chunk_size", std::int64_t{0});
    }

    void to_json(nlohmann::json &json, const OpenUploadResponse &response)
    {
        json = {
            {"upload_id", response.upload_id},
            {"filename", response.filename},
            {"size", response.size},
            {"chunk_size", response.chunk_size},
            {"total_chunks", response.total_chunks},
            {"received_indices", response.received_indices},
            {"resumed", response.resumed},
        };
    }

    void from_json(const nlohmann::json &json, OpenUploadResponse &response)
    {
        response.upload_id = json.at("upload_id").get<std::string>();
        response.filename = json.value("filename", std::string{});
        response.size = json.value("size", 0ULL);
        response.chunk_size = json.value("chunk_size", 0ULL);
        response.total_chunks = json.value("total_chunks", 0ULL);
        response.received_indices = json.value("received_indices", std::vector<std::uint64_t>{});
        response.resumed = json.value("resumed", false);
    }

    void to_json(nlohmann::json &json, const PutChunkRequest &request)
    {
        json = {
            {"upload_id", request.upload_id},
            {"index", request.index},
            {"data", request.data_base64},
        };
    }

    void from_json(const nlohmann::json &json, PutChunkRequest &request)
    {
        request.upload_id = json.at("upload_id").get<std::string>();
        request.index = json.at("index").get<std::int64_t>();
        request.data_base64 = json.value("data", std::string{});
    }

    void to_json(nlohmann::json &json, const PutChunkResponse &response)
    {
        json = {
            {"upload_id", response.upload_id},
            {"index", response.index},
            {"bytes", response.bytes},
            {"duplicate", response.duplicate},
        };
    }

    void from_json(const nlohmann::json &json, PutChunkResponse &response)
    {
        response.upload_id = json.at("upload_id").get<std::string>();
        response.index = json.value("index", 0ULL);
        response.bytes = json.value("bytes", 0ULL);
        response.duplicate = json.value("duplicate", false);
    }

    void to_json(nlohmann::json &json, const UploadRef &request)
    {
        json = {{"upload_id", request.upload_id}};
    }

    void from_json(const nlohmann::json &json, UploadRef &request)
    {
        request.upload_id = json.at("upload_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const StatsSnapshot &stats)
    {
        json = {
            {"bytes_received", stats.bytes_received},
            {"upload_active_seconds", stats.upload_active_seconds},
            {"downtime_seconds", stats.downtime_seconds},
            {"assembly_seconds", stats.assembly_seconds},
            {"peak_concurrency", stats.peak_concurrency},
            {"current_concurrency", stats.current_concurrency},
            {"concurrency_cumulative_seconds", stats.concurrency_cumulative_seconds},
        };
        put_optional(json, "avg_upload_bps", stats.avg_upload_bps);
        put_optional(json, "avg_concurrency", stats.avg_concurrency);
        put_optional(json, "upload_start", stats.upload_start);
        put_optional(json, "upload_end", stats.upload_end);
        put_optional(json, "finalized_at", stats.finalized_at);
    }

    void from_json(const nlohmann::json &json, StatsSnapshot &stats)
    {
        stats.bytes_received = json.value("bytes_received", 0ULL);
        stats.upload_active_seconds = json.value("upload_active_seconds", 0.0);
        stats.downtime_seconds = json.value("downtime_seconds", 0.0);
        stats.assembly_seconds = json.value("assembly_seconds", 0.0);
        stats.peak_concurrency = json.value("peak_concurrency", 0u);
        stats.current_concurrency = json.value("current_concurrency", 0u);
        stats.concurrency_cumulative_seconds = json.value("concurrency_cumulative_seconds", 0.0);
        stats.avg_upload_bps = read_optional<double>(json, "avg_upload_bps");
        stats.avg_concurrency = read_optional<double>(json, "avg_concurrency");
        stats.upload_start = read_optional<std::string>(json, "upload_start");
        stats.upload_end = read_optional<std::string>(json, "upload_end");
        stats.finalized_at = read_optional<std::string>(json, "finalized_at");
    }

    void to_json(nlohmann::json &json, const StatusResponse &response)
    {
        json = {
            {"upload_id", response.upload_id},
            {"filename", response.filename},
            {"size", response.size},
            {"chunk_size", response.chunk_size},
            {"total_chunks", response.total_chunks},
            {"received", response.received},
            {"missing", response.missing},
            {"finalized", response.finalized},
            {"updated_at", response.updated_at},
        };
        put_optional(json, "artifact", response.artifact);
        put_optional(json, "stats", response.stats);
    }

    void from_json(const nlohmann::json &json, StatusResponse &response)
    {
        response.upload_id = json.at("upload_id").get<std::string>();
        response.filename = json.value("filename", std::string{});
        response.size = json.value("size", 0ULL);
        response.chunk_size = json.value("chunk_size", 0ULL);
        response.total_chunks = json.value("total_chunks", 0ULL);
        response.received = json.value("received", 0ULL);
        response.missing = json.value("missing", std::vector<std::uint64_t>{});
        response.finalized = json.value("finalized", false);
        response.updated_at = json.value("updated_at", std::string{});
        response.artifact = read_optional<std::string>(json, "artifact");
        response.stats = read_optional<StatsSnapshot>(json, "stats");
    }

    void to_json(nlohmann::json &json, const FinalizeResponse &response)
    {
        json = {
            {"already", response.already},
            {"artifact", response.artifact},
        };
        put_optional(json, "stats", response.stats);
    }

    void from_json(const nlohmann::json &json, FinalizeResponse &response)
    {
        response.already = json.value("already", false);
        response.artifact = json.value("artifact", std::string{});
        response.stats = read_optional<StatsSnapshot>(json, "stats");
    }

    void to_json(nlohmann::json &json, const FetchInitRequest &request)
    {
        json = {{"filename", request.filename}};
    }

    void from_json(const nlohmann::json &json, FetchInitRequest &request)
    {
        request.filename = json.at("filename").get<std::string>();
    }

    void to_json(nlohmann::json &json, const FetchInitResponse &response)
    {
        json = {
            {"filename", response.filename},
            {"size", response.size},
            {"chunk_size", response.chunk_size},
        };
    }

    void from_json(const nlohmann::json &json, FetchInitResponse &response)
    {
        response.filename = json.at("filename").get<std::string>();
        response.size = json.value("size", 0ULL);
        response.chunk_size = json.value("chunk_size", 0ULL);
    }

    void to_json(nlohmann::json &json, const FetchChunkRequest &request)
    {
        json = {
            {"filename", request.filename},
            {"offset", request.offset},
            {"max_bytes", request.max_bytes},
        };
    }

    void from_json(const nlohmann::json &json, FetchChunkRequest &request)
    {
        request.filename = json.at("filename").get<std::string>();
        request.offset = json.value("offset", 0ULL);
        request.max_bytes = json.value("max_bytes", 0ULL);
    }

    void to_json(nlohmann::json &json, const FetchChunkResponse &response)
    {
        json = {
            {"filename", response.filename},
            {"offset", response.offset},
            {"bytes", response.bytes},
            {"done", response.done},
            {"data", response.data_base64},
        };
    }

    void from_json(const nlohmann::json &json, FetchChunkResponse &response)
    {
        response.filename = json.at("filename").get<std::string>();
        response.offset = json.value("offset", 0ULL);
        response.bytes = json.value("bytes", 0ULL);
        response.done = json.value("done", false);
        response.data_base64 = json.value("data", std::string{});
    }

} // namespace filedrop::protocol

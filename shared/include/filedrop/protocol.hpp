/**
 * FileDrop - Shared protocol schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "filedrop/error_codes.hpp"

namespace filedrop::protocol
{

    enum class Command : std::uint8_t
    {
        OpenUpload,
        PutChunk,
        GetStatus,
        Finalize,
        FetchInit,
        FetchChunk,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    // Sizes are signed so that negative values from clients can be rejected
    // instead of wrapping.
    struct OpenUploadRequest
    {
        std::string checksum;
        std::string filename;
        std::int64_t size{};
        std::int64_t chunk_size{};
    };

    void to_json(nlohmann::json &json, const OpenUploadRequest &request);
    void from_json(const nlohmann::json &json, OpenUploadRequest &request);

    struct OpenUploadResponse
    {
        std::string upload_id;
        std::string filename;
        std::uint64_t size{};
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::vector<std::uint64_t> received_indices;
        bool resumed{};
    };

    void to_json(nlohmann::json &json, const OpenUploadResponse &response);
    void from_json(const nlohmann::json &json, OpenUploadResponse &response);

    struct PutChunkRequest
    {
        std::string upload_id;
        std::int64_t index{};
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const PutChunkRequest &request);
    void from_json(const nlohmann::json &json, PutChunkRequest &request);

    struct PutChunkResponse
    {
        std::string upload_id;
        std::uint64_t index{};
        std::uint64_t bytes{};
        bool duplicate{};
    };

    void to_json(nlohmann::json &json, const PutChunkResponse &response);
    void from_json(const nlohmann::json &json, PutChunkResponse &response);

    struct UploadRef
    {
        std::string upload_id;
    };

    void to_json(nlohmann::json &json, const UploadRef &request);
    void from_json(const nlohmann::json &json, UploadRef &request);

    // Timestamps are ISO-8601 UTC strings with millisecond precision.
    struct StatsSnapshot
    {
        std::uint64_t bytes_received{};
        double upload_active_seconds{};
        double downtime_seconds{};
        double assembly_seconds{};
        std::uint32_t peak_concurrency{};
        std::uint32_t current_concurrency{};
        double concurrency_cumulative_seconds{};
        std::optional<double> avg_upload_bps{};
        std::optional<double> avg_concurrency{};
        std::optional<std::string> upload_start{};
        std::optional<std::string> upload_end{};
        std::optional<std::string> finalized_at{};
    };

    void to_json(nlohmann::json &json, const StatsSnapshot &stats);
    void from_json(const nlohmann::json &json, StatsSnapshot &stats);

    struct StatusResponse
    {
        std::string upload_id;
        std::string filename;
        std::uint64_t size{};
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::uint64_t received{};
        std::vector<std::uint64_t> missing;
        bool finalized{};
        std::string updated_at;
        std::optional<std::string> artifact{};
        std::optional<StatsSnapshot> stats{};
    };

    void to_json(nlohmann::json &json, const StatusResponse &response);
    void from_json(const nlohmann::json &json, StatusResponse &response);

    struct FinalizeResponse
    {
        bool already{};
        std::string artifact;
        std::optional<StatsSnapshot> stats{};
    };

    void to_json(nlohmann::json &json, const FinalizeResponse &response);
    void from_json(const nlohmann::json &json, FinalizeResponse &response);

    struct FetchInitRequest
    {
        std::string filename;
    };

    void to_json(nlohmann::json &json, const FetchInitRequest &request);
    void from_json(const nlohmann::json &json, FetchInitRequest &request);

    struct FetchInitResponse
    {
        std::string filename;
        std::uint64_t size{};
        std::uint64_t chunk_size{};
    };

    void to_json(nlohmann::json &json, const FetchInitResponse &response);
    void from_json(const nlohmann::json &json, FetchInitResponse &response);

    struct FetchChunkRequest
    {
        std::string filename;
        std::uint64_t offset{};
        std::uint64_t max_bytes{};
    };

    void to_json(nlohmann::json &json, const FetchChunkRequest &request);
    void from_json(const nlohmann::json &json, FetchChunkRequest &request);

    struct FetchChunkResponse
    {
        std::string filename;
        std::uint64_t offset{};
        std::uint64_t bytes{};
        bool done{};
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const FetchChunkResponse &response);
    void from_json(const nlohmann::json &json, FetchChunkResponse &response);

} // namespace filedrop::protocol

#include "session_common.hpp"

#include "filedrop/error_codes.hpp"

namespace filedrop::server::session_common
{

    namespace
    {

        std::optional<std::string> format_optional(const std::optional<Timestamp> &time)
        {
            if (!time)
            {
                return std::nullopt;
            }
            return format_iso8601(*time);
        }

    } // namespace

    filedrop::protocol::StatsSnapshot to_snapshot(const UploadStats &stats)
    {
        return {
            .bytes_received = stats.bytes_received,
            .upload_active_seconds = stats.active_seconds,
            .downtime_seconds = stats.downtime_seconds,
            .assembly_seconds = stats.assembly_seconds,
            .peak_concurrency = stats.peak_concurrency,
            .current_concurrency = stats.current_concurrency,
            .concurrency_cumulative_seconds = stats.concurrency_seconds,
            .avg_upload_bps = stats.average_upload_bps(),
            .avg_concurrency = stats.average_concurrency(),
            // Before finalize the span so far comes from the live counters.
            .upload_start = format_optional(stats.upload_start ? stats.upload_start : stats.first_activity),
            .upload_end = format_optional(stats.upload_end ? stats.upload_end : stats.last_activity_end),
            .finalized_at = format_optional(stats.finalized_at),
        };
    }

    filedrop::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                          const std::optional<std::string> &request_id)
    {
        filedrop::protocol::ResponseEnvelope envelope;
        envelope.kind = filedrop::protocol::ResponseKind::Ok;
        envelope.payload = std::move(payload);
        envelope.error = filedrop::ErrorCode::Ok;
        envelope.request_id = request_id;
        return envelope;
    }

} // namespace filedrop::server::session_common

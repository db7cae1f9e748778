#include "filedrop/server/session.hpp"

#include <nlohmann/json.hpp>

#include "filedrop/encoding/base64.hpp"
#include "filedrop/server/artifact_store.hpp"
#include "session_common.hpp"

namespace filedrop::server
{

    void Session::handle_fetch_init(const filedrop::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<filedrop::protocol::FetchInitRequest>();
            const auto info = services_.uploads.fetch_info(request.filename);

            filedrop::protocol::FetchInitResponse response{
                .filename = info.name,
                .size = info.size,
                .chunk_size = kFetchChunkSize,
            };
            send_response(session_common::make_ok_response(response, envelope.request_id));
        }
        catch (const UploadError &err)
        {
            send_error(err.code(), err.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(filedrop::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(filedrop::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_fetch_chunk(const filedrop::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<filedrop::protocol::FetchChunkRequest>();
            const auto info = services_.uploads.fetch_info(request.filename);
            const auto data = services_.uploads.fetch_range(request.filename, request.offset, request.max_bytes);

            filedrop::protocol::FetchChunkResponse response{
                .filename = info.name,
                .offset = request.offset,
                .bytes = data.size(),
                .done = request.offset + data.size() >= info.size,
                .data_base64 = filedrop::encoding::encode_base64(data),
            };
            send_response(session_common::make_ok_response(response, envelope.request_id));
        }
        catch (const UploadError &err)
        {
            send_error(err.code(), err.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(filedrop::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(filedrop::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

} // namespace filedrop::server

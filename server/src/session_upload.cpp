#include "filedrop/server/session.hpp"

#include <nlohmann/json.hpp>

#include "filedrop/encoding/base64.hpp"
#include "session_common.hpp"

namespace filedrop::server
{

    void Session::handle_open_upload(const filedrop::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<filedrop::protocol::OpenUploadRequest>();
            const auto opened = services_.uploads.open(request.checksum, request.filename, request.size,
                                                       request.chunk_size);

            filedrop::protocol::OpenUploadResponse response{
                .upload_id = opened.upload.handle,
                .filename = opened.upload.filename,
                .size = opened.upload.size,
                .chunk_size = opened.upload.chunk_size,
                .total_chunks = opened.upload.chunk_count,
                .received_indices = opened.received_indices,
                .resumed = opened.resumed,
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

    void Session::handle_put_chunk(const filedrop::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<filedrop::protocol::PutChunkRequest>();
            const auto data = filedrop::encoding::decode_base64(request.data_base64);
            if (!data)
            {
                send_error(filedrop::ErrorCode::InvalidPayload, "Chunk data is not valid base64", envelope.request_id);
                return;
            }
            const auto ack = services_.uploads.put_chunk(request.upload_id, request.index, *data);

            filedrop::protocol::PutChunkResponse response{
                .upload_id = ack.handle,
                .index = ack.index,
                .bytes = ack.bytes,
                .duplicate = ack.duplicate,
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

    void Session::handle_get_status(const filedrop::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<filedrop::protocol::UploadRef>();
            const auto status = services_.uploads.status(request.upload_id);

            filedrop::protocol::StatusResponse response{
                .upload_id = status.upload.handle,
                .filename = status.upload.filename,
                .size = status.upload.size,
                .chunk_size = status.upload.chunk_size,
                .total_chunks = status.upload.chunk_count,
                .received = status.received,
                .missing = status.missing,
                .finalized = status.upload.finalized(),
                .updated_at = format_iso8601(status.upload.updated_at),
                .artifact = status.upload.artifact,
                .stats = session_common::to_snapshot(status.stats),
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

    void Session::handle_finalize(const filedrop::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<filedrop::protocol::UploadRef>();
            const auto result = services_.uploads.finalize(request.upload_id);

            filedrop::protocol::FinalizeResponse response{
                .already = result.already,
                .artifact = result.artifact,
                .stats = session_common::to_snapshot(result.stats),
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

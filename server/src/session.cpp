#include "filedrop/server/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <span>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "filedrop/version.hpp"
#include "session_common.hpp"

namespace filedrop::server
{

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services)
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        endpoint_label_ = ec ? std::string{"unknown"} : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    Session::~Session()
    {
        spdlog::debug("Session for {} released", endpoint_label_);
    }

    void Session::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Session::stop()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             const auto payload_size = filedrop::protocol::decode_frame_length(
                                 std::span<const std::uint8_t, filedrop::protocol::kFrameHeaderSize>(header_buffer_));
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             if (payload_size > services_.max_frame_size)
                             {
                                 spdlog::warn("{} sent a {} byte frame (limit {}), disconnecting", remote_endpoint(),
                                              payload_size, services_.max_frame_size);
                                 send_error(filedrop::ErrorCode::InvalidPayload, "Frame too large", std::nullopt, true);
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             nlohmann::json json;
                             try
                             {
                                 json = nlohmann::json::parse(buffer_.begin(), buffer_.end());
                             }
                             catch (const nlohmann::json::exception &ex)
                             {
                                 send_error(filedrop::ErrorCode::InvalidPayload, ex.what());
                                 return;
                             }
                             buffer_.clear();
                             buffer_.shrink_to_fit();
                             process_message(json);
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        std::optional<std::string> request_id;
        if (json.is_object())
        {
            if (auto it = json.find("id"); it != json.end() && it->is_string())
            {
                request_id = it->get<std::string>();
            }
            if (auto it = json.find("cmd"); it != json.end() && it->is_string() &&
                                            !filedrop::protocol::command_from_string(it->get<std::string>()))
            {
                send_error(filedrop::ErrorCode::InvalidCommand, "Unknown command: " + it->get<std::string>(),
                           request_id);
                return;
            }
        }

        filedrop::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<filedrop::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(filedrop::ErrorCode::InvalidPayload, ex.what(), request_id);
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), filedrop::protocol::to_string(envelope.command));

        switch (envelope.command)
        {
        case filedrop::protocol::Command::OpenUpload:
            handle_open_upload(envelope);
            break;
        case filedrop::protocol::Command::PutChunk:
            handle_put_chunk(envelope);
            break;
        case filedrop::protocol::Command::GetStatus:
            handle_get_status(envelope);
            break;
        case filedrop::protocol::Command::Finalize:
            handle_finalize(envelope);
            break;
        case filedrop::protocol::Command::FetchInit:
            handle_fetch_init(envelope);
            break;
        case filedrop::protocol::Command::FetchChunk:
            handle_fetch_chunk(envelope);
            break;
        case filedrop::protocol::Command::Ping:
            handle_ping(envelope);
            break;
        default:
            send_error(filedrop::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    void Session::send_response(const filedrop::protocol::ResponseEnvelope &envelope, bool close_after)
    {
        std::shared_ptr<std::vector<std::uint8_t>> frame;
        try
        {
            frame = std::make_shared<std::vector<std::uint8_t>>(
                filedrop::protocol::encode_frame(nlohmann::json(envelope)));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Cannot encode response for {}: {}", remote_endpoint(), ex.what());
            stop();
            return;
        }

        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*frame),
                          [this, self, frame, close_after](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec || close_after)
                              {
                                  stop();
                                  return;
                              }
                              read_frame_header();
                          });
    }

    void Session::send_error(filedrop::ErrorCode code, std::string message, std::optional<std::string> request_id,
                             bool close_after)
    {
        filedrop::protocol::ResponseEnvelope envelope;
        envelope.kind = filedrop::protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = std::move(request_id);
        send_response(envelope, close_after);
    }

    void Session::handle_ping(const filedrop::protocol::RequestEnvelope &envelope)
    {
        nlohmann::json payload;
        payload["pong"] = true;
        payload["version"] = std::string(filedrop::version());
        send_response(session_common::make_ok_response(std::move(payload), envelope.request_id));
    }

    std::string Session::remote_endpoint() const
    {
        return endpoint_label_;
    }

} // namespace filedrop::server

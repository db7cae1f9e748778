#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "filedrop/error_codes.hpp"
#include "filedrop/framing.hpp"
#include "filedrop/protocol.hpp"
#include "filedrop/server/upload_service.hpp"

namespace filedrop::server
{

    struct ServerServices
    {
        UploadService &uploads;
        std::size_t max_frame_size;
    };

    // One client connection. Requests are handled strictly one after the
    // other: the next frame is read only once the previous response has
    // been written.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);
        ~Session();

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void send_response(const filedrop::protocol::ResponseEnvelope &envelope, bool close_after = false);
        void send_error(filedrop::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt, bool close_after = false);

        void handle_open_upload(const filedrop::protocol::RequestEnvelope &envelope);
        void handle_put_chunk(const filedrop::protocol::RequestEnvelope &envelope);
        void handle_get_status(const filedrop::protocol::RequestEnvelope &envelope);
        void handle_finalize(const filedrop::protocol::RequestEnvelope &envelope);
        void handle_fetch_init(const filedrop::protocol::RequestEnvelope &envelope);
        void handle_fetch_chunk(const filedrop::protocol::RequestEnvelope &envelope);
        void handle_ping(const filedrop::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;
        std::string endpoint_label_;

        std::array<std::uint8_t, filedrop::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        bool closed_{false};
    };

} // namespace filedrop::server

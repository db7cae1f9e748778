/**
 * FileDrop - Length-prefixed JSON framing helpers.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace filedrop::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    // Payload length announced by a frame header.
    std::uint32_t decode_frame_length(std::span<const std::uint8_t, kFrameHeaderSize> header) noexcept;

    // Throws std::length_error when the announced payload exceeds max_payload.
    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer, std::size_t max_payload);

} // namespace filedrop::protocol

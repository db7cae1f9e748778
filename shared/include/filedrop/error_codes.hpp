/**
 * FileDrop - Shared error codes used across the wire protocol and server layers.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace filedrop
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        InvalidParameters = 3,
        SizeLimitExceeded = 4,
        ChunkSizeLimitExceeded = 5,
        NotFound = 6,
        AlreadyFinalized = 7,
        IndexOutOfRange = 8,
        EmptyBody = 9,
        Incomplete = 10,
        SizeMismatch = 11,
        ChecksumMismatch = 12,
        StorageError = 13,
        Unsupported = 14,
        InternalError = 15
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace filedrop

#include "filedrop/error_codes.hpp"

#include <array>

namespace filedrop
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 16> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::InvalidParameters, "invalid_parameters"},
            {ErrorCode::SizeLimitExceeded, "size_limit_exceeded"},
            {ErrorCode::ChunkSizeLimitExceeded, "chunk_size_limit_exceeded"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::AlreadyFinalized, "already_finalized"},
            {ErrorCode::IndexOutOfRange, "index_out_of_range"},
            {ErrorCode::EmptyBody, "empty_body"},
            {ErrorCode::Incomplete, "incomplete"},
            {ErrorCode::SizeMismatch, "size_mismatch"},
            {ErrorCode::ChecksumMismatch, "checksum_mismatch"},
            {ErrorCode::StorageError, "storage_error"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

} // namespace filedrop

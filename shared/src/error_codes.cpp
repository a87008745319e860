#include "treasury/error_codes.hpp"

#include <array>

namespace treasury
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 20> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::AuthenticationRequired, "authentication_required"},
            {ErrorCode::AuthenticationFailed, "authentication_failed"},
            {ErrorCode::PermissionDenied, "permission_denied"},
            {ErrorCode::Conflict, "conflict"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::InternalError, "internal_error"},
            {ErrorCode::UnknownHandle, "unknown_handle"},
            {ErrorCode::DuplicateChunk, "duplicate_chunk"},
            {ErrorCode::StaleChunk, "stale_chunk"},
            {ErrorCode::ChunkSizeMismatch, "chunk_size_mismatch"},
            {ErrorCode::TooManyPendingChunks, "too_many_pending_chunks"},
            {ErrorCode::IncompleteUpload, "incomplete_upload"},
            {ErrorCode::AlreadyFinalizing, "already_finalizing"},
            {ErrorCode::IoError, "io_error"},
            {ErrorCode::FinalizeIoError, "finalize_io_error"},
            {ErrorCode::FileNotFound, "file_not_found"},
            {ErrorCode::ChunkOutOfRange, "chunk_out_of_range"},
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

    bool is_client_error(ErrorCode code) noexcept
    {
        switch (code)
        {
        case ErrorCode::InternalError:
        case ErrorCode::IoError:
        case ErrorCode::FinalizeIoError:
            return false;
        default:
            return code != ErrorCode::Ok;
        }
    }

} // namespace treasury

/**
 * Treasury - Error codes shared by the transfer engine and the wire protocol.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace treasury
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        AuthenticationRequired = 3,
        AuthenticationFailed = 4,
        PermissionDenied = 5,
        Conflict = 6,
        Unsupported = 7,
        InternalError = 8,

        // Transfer engine
        UnknownHandle = 100,
        DuplicateChunk = 101,
        StaleChunk = 102,
        ChunkSizeMismatch = 103,
        TooManyPendingChunks = 104,
        IncompleteUpload = 105,
        AlreadyFinalizing = 106,
        IoError = 107,
        FinalizeIoError = 108,
        FileNotFound = 109,
        ChunkOutOfRange = 110
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // Client-caused failures leave the transfer usable; server-side ones do not.
    bool is_client_error(ErrorCode code) noexcept;

} // namespace treasury

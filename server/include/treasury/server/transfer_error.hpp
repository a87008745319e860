#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "treasury/error_codes.hpp"

namespace treasury::server
{

    using UserId = std::uint64_t;

    class TransferError : public std::runtime_error
    {
    public:
        TransferError(treasury::ErrorCode code, std::string message, std::uint64_t bytes_remaining = 0);

        treasury::ErrorCode code() const noexcept { return code_; }

        // Only meaningful for ErrorCode::IncompleteUpload.
        std::uint64_t bytes_remaining() const noexcept { return bytes_remaining_; }

    private:
        treasury::ErrorCode code_;
        std::uint64_t bytes_remaining_;
    };

} // namespace treasury::server

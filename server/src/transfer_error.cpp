#include "treasury/server/transfer_error.hpp"

namespace treasury::server
{

    TransferError::TransferError(treasury::ErrorCode code, std::string message, std::uint64_t bytes_remaining)
        : std::runtime_error(std::move(message)), code_(code), bytes_remaining_(bytes_remaining) {}

} // namespace treasury::server

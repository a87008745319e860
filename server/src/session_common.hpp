#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "treasury/protocol.hpp"

namespace treasury::server::session_common
{

    treasury::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                          const std::optional<std::string> &request_id);

    // Throws TransferError(InvalidPayload) naming `field` when the value is not base64.
    std::vector<std::byte> decode_base64_field(std::string_view field, const std::string &value);

} // namespace treasury::server::session_common

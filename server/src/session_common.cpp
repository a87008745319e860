#include "session_common.hpp"

#include "treasury/encoding/base64.hpp"
#include "treasury/error_codes.hpp"
#include "treasury/server/transfer_error.hpp"

namespace treasury::server::session_common
{

    treasury::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                          const std::optional<std::string> &request_id)
    {
        treasury::protocol::ResponseEnvelope envelope;
        envelope.kind = treasury::protocol::ResponseKind::Ok;
        envelope.payload = std::move(payload);
        envelope.message = "";
        envelope.error = treasury::ErrorCode::Ok;
        envelope.request_id = request_id;
        return envelope;
    }

    std::vector<std::byte> decode_base64_field(std::string_view field, const std::string &value)
    {
        auto decoded = treasury::encoding::decode_base64(value);
        if (!decoded)
        {
            throw TransferError(treasury::ErrorCode::InvalidPayload, "Invalid base64 in " + std::string(field));
        }
        return std::move(*decoded);
    }

} // namespace treasury::server::session_common

#include "treasury/server/session.hpp"

#include <nlohmann/json.hpp>

#include "treasury/encoding/base64.hpp"
#include "session_common.hpp"

namespace treasury::server
{

    void Session::handle_download_chunk(const treasury::protocol::RequestEnvelope &envelope)
    {
        if (!require_authenticated(envelope))
        {
            return;
        }
        const auto request = envelope.payload.get<treasury::protocol::DownloadChunkRequest>();
        auto stream = services_.transfers.read_download_chunk(*user_, request.handle, request.chunk_id);
        const auto data = stream.read_all();

        treasury::protocol::DownloadChunkResponse chunk{
            .handle = request.handle,
            .chunk_id = request.chunk_id,
            .bytes = static_cast<std::uint64_t>(data.size()),
            .data_base64 = treasury::encoding::encode_base64(data),
        };
        nlohmann::json payload = chunk;
        send_response(session_common::make_ok_response(std::move(payload), envelope.request_id));
    }

} // namespace treasury::server

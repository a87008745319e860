#include "treasury/server/session.hpp"

#include <nlohmann/json.hpp>

#include "session_common.hpp"

namespace treasury::server
{

    void Session::handle_upload_start(const treasury::protocol::RequestEnvelope &envelope)
    {
        if (!require_authenticated(envelope))
        {
            return;
        }
        const auto request = envelope.payload.get<treasury::protocol::UploadStartRequest>();
        const auto ticket = services_.transfers.open_upload(*user_, request.file_size);

        treasury::protocol::UploadStartResponse response{
            .handle = ticket.handle,
            .chunk_count = ticket.chunk_count,
            .container_size = ticket.container_size,
        };
        nlohmann::json payload = response;
        send_response(session_common::make_ok_response(std::move(payload), envelope.request_id));
    }

    void Session::handle_upload_chunk(const treasury::protocol::RequestEnvelope &envelope)
    {
        if (!require_authenticated(envelope))
        {
            return;
        }
        const auto request = envelope.payload.get<treasury::protocol::UploadChunkRequest>();
        auto data = session_common::decode_base64_field("data", request.data_base64);
        const auto flushed = services_.transfers.accept_chunk(*user_, request.handle, request.chunk_id, std::move(data));

        nlohmann::json payload;
        payload["flushed"] = flushed;
        send_response(session_common::make_ok_response(std::move(payload), envelope.request_id));
    }

    void Session::handle_upload_finalise(const treasury::protocol::RequestEnvelope &envelope)
    {
        if (!require_authenticated(envelope))
        {
            return;
        }
        const auto request = envelope.payload.get<treasury::protocol::UploadFinaliseRequest>();
        FinalizeRequest finalize{
            .parent_handle = request.parent_handle,
            .fields = EncryptedFields{
                .metadata = session_common::decode_base64_field("encrypted_metadata", request.encrypted_metadata_base64),
                .crypt_key = session_common::decode_base64_field("encrypted_crypt_key", request.encrypted_crypt_key_base64),
                .signature = session_common::decode_base64_field("signature", request.signature_base64),
            },
        };
        const auto finalized = services_.transfers.finalize_upload(*user_, request.handle, std::move(finalize));

        treasury::protocol::UploadFinaliseResponse response{
            .size = finalized.raw_size,
            .container_size = finalized.container_size,
        };
        nlohmann::json payload = response;
        send_response(session_common::make_ok_response(std::move(payload), envelope.request_id));
    }

    void Session::handle_upload_cancel(const treasury::protocol::RequestEnvelope &envelope)
    {
        if (!require_authenticated(envelope))
        {
            return;
        }
        const auto request = envelope.payload.get<treasury::protocol::HandleRequest>();
        services_.transfers.cancel_upload(*user_, request.handle);
        send_response(session_common::make_ok_response(nlohmann::json::object(), envelope.request_id));
    }

} // namespace treasury::server

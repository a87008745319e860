#include "treasury/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "session_common.hpp"

namespace treasury::server
{

    void Session::handle_authenticate(const treasury::protocol::RequestEnvelope &envelope)
    {
        if (user_)
        {
            send_error(treasury::ErrorCode::Conflict, "Already authenticated", envelope.request_id);
            return;
        }

        const auto request = envelope.payload.get<treasury::protocol::AuthenticateRequest>();
        const auto user = services_.tokens.authorize(request.token);
        if (!user)
        {
            spdlog::warn("Rejected access token from {}", endpoint_);
            send_error(treasury::ErrorCode::AuthenticationFailed, "Invalid access token", envelope.request_id);
            return;
        }

        user_ = *user;
        treasury::protocol::AuthenticateResponse response{.user_id = *user};
        nlohmann::json payload = response;
        send_response(session_common::make_ok_response(std::move(payload), envelope.request_id));
        spdlog::info("Session authenticated as user {} ({})", *user, endpoint_);
    }

    void Session::handle_ping(const treasury::protocol::RequestEnvelope &envelope)
    {
        send_response(session_common::make_ok_response(nlohmann::json::object(), envelope.request_id));
    }

} // namespace treasury::server

#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "treasury/error_codes.hpp"
#include "treasury/framing.hpp"
#include "treasury/protocol.hpp"
#include "treasury/server/access_tokens.hpp"
#include "treasury/server/transfer_service.hpp"

namespace treasury::server
{

    struct ServerServices
    {
        TransferService &transfers;
        const AccessTokens &tokens;
        std::size_t max_frame_size{protocol::kDefaultMaxFrameSize};
    };

    // One client connection. The socket is bound to a strand, so handlers of one
    // session never run concurrently.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);
        ~Session();

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void send_response(const treasury::protocol::ResponseEnvelope &envelope);
        void send_error(treasury::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt);
        void send_transfer_error(const TransferError &error, const std::optional<std::string> &request_id);
        void write_next();

        bool require_authenticated(const treasury::protocol::RequestEnvelope &envelope);

        // Command handlers
        void handle_authenticate(const treasury::protocol::RequestEnvelope &envelope);
        void handle_ping(const treasury::protocol::RequestEnvelope &envelope);
        void handle_upload_start(const treasury::protocol::RequestEnvelope &envelope);
        void handle_upload_chunk(const treasury::protocol::RequestEnvelope &envelope);
        void handle_upload_finalise(const treasury::protocol::RequestEnvelope &envelope);
        void handle_upload_cancel(const treasury::protocol::RequestEnvelope &envelope);
        void handle_download_chunk(const treasury::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;
        std::string endpoint_;

        std::array<std::uint8_t, treasury::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        std::deque<std::vector<std::uint8_t>> write_queue_;
        std::optional<UserId> user_;
        bool closed_{false};
    };

} // namespace treasury::server

#include "treasury/server/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <string>

#include <spdlog/spdlog.h>

namespace treasury::server
{

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services), endpoint_(remote_endpoint()) {}

    Session::~Session()
    {
        spdlog::debug("Session for {} released", endpoint_);
    }

    void Session::start()
    {
        spdlog::info("Client connected from {}", endpoint_);
        read_frame_header();
    }

    void Session::stop()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", endpoint_);
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             const std::uint32_t payload_size = treasury::protocol::read_frame_header(header_buffer_);
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             if (payload_size > services_.max_frame_size)
                             {
                                 spdlog::warn("{} sent a {} byte frame, limit is {}", endpoint_, payload_size,
                                              services_.max_frame_size);
                                 stop();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             nlohmann::json json;
                             try
                             {
                                 json = nlohmann::json::parse(buffer_.begin(), buffer_.end());
                             }
                             catch (const nlohmann::json::parse_error &ex)
                             {
                                 send_error(treasury::ErrorCode::InvalidPayload, ex.what());
                                 read_frame_header();
                                 return;
                             }
                             process_message(json);
                             read_frame_header();
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        treasury::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<treasury::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(treasury::ErrorCode::InvalidCommand, ex.what());
            return;
        }

        spdlog::debug("{} -> command {}", endpoint_, treasury::protocol::to_string(envelope.command));

        try
        {
            switch (envelope.command)
            {
            case treasury::protocol::Command::Authenticate:
                handle_authenticate(envelope);
                break;
            case treasury::protocol::Command::Ping:
                handle_ping(envelope);
                break;
            case treasury::protocol::Command::UploadStart:
                handle_upload_start(envelope);
                break;
            case treasury::protocol::Command::UploadChunk:
                handle_upload_chunk(envelope);
                break;
            case treasury::protocol::Command::UploadFinalise:
                handle_upload_finalise(envelope);
                break;
            case treasury::protocol::Command::UploadCancel:
                handle_upload_cancel(envelope);
                break;
            case treasury::protocol::Command::DownloadChunk:
                handle_download_chunk(envelope);
                break;
            default:
                send_error(treasury::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
                break;
            }
        }
        catch (const TransferError &ex)
        {
            send_transfer_error(ex, envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(treasury::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} failed for {}: {}", treasury::protocol::to_string(envelope.command), endpoint_,
                          ex.what());
            send_error(treasury::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Session::send_response(const treasury::protocol::ResponseEnvelope &envelope)
    {
        if (closed_)
        {
            return;
        }
        const auto json = nlohmann::json(envelope);
        write_queue_.push_back(treasury::protocol::encode_frame(json));
        if (write_queue_.size() == 1)
        {
            write_next();
        }
    }

    void Session::write_next()
    {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(write_queue_.front()),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  write_queue_.clear();
                                  stop();
                                  return;
                              }
                              write_queue_.pop_front();
                              if (!write_queue_.empty())
                              {
                                  write_next();
                              }
                          });
    }

    void Session::send_error(treasury::ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        treasury::protocol::ResponseEnvelope envelope;
        envelope.kind = treasury::protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    void Session::send_transfer_error(const TransferError &error, const std::optional<std::string> &request_id)
    {
        treasury::protocol::ResponseEnvelope envelope;
        envelope.kind = treasury::protocol::ResponseKind::Error;
        envelope.error = error.code();
        envelope.message = error.what();
        envelope.request_id = request_id;
        if (error.code() == treasury::ErrorCode::IncompleteUpload)
        {
            envelope.payload["bytes_remaining"] = error.bytes_remaining();
        }
        send_response(envelope);
    }

    bool Session::require_authenticated(const treasury::protocol::RequestEnvelope &envelope)
    {
        if (!user_)
        {
            send_error(treasury::ErrorCode::AuthenticationRequired, "Authentication required", envelope.request_id);
            return false;
        }
        return true;
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace treasury::server

/**
 * Treasury - Wire protocol schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "treasury/error_codes.hpp"

namespace treasury::protocol
{

    enum class Command : std::uint8_t
    {
        Authenticate,
        UploadStart,
        UploadChunk,
        UploadFinalise,
        UploadCancel,
        DownloadChunk,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct AuthenticateRequest
    {
        std::string token;
    };

    void to_json(nlohmann::json &json, const AuthenticateRequest &request);
    void from_json(const nlohmann::json &json, AuthenticateRequest &request);

    struct AuthenticateResponse
    {
        std::uint64_t user_id{};
    };

    void to_json(nlohmann::json &json, const AuthenticateResponse &response);
    void from_json(const nlohmann::json &json, AuthenticateResponse &response);

    struct UploadStartRequest
    {
        std::uint64_t file_size{};
    };

    void to_json(nlohmann::json &json, const UploadStartRequest &request);
    void from_json(const nlohmann::json &json, UploadStartRequest &request);

    struct UploadStartResponse
    {
        std::string handle;
        std::uint64_t chunk_count{};
        std::uint64_t container_size{};
    };

    void to_json(nlohmann::json &json, const UploadStartResponse &response);
    void from_json(const nlohmann::json &json, UploadStartResponse &response);

    struct UploadChunkRequest
    {
        std::string handle;
        std::uint64_t chunk_id{};
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    struct UploadFinaliseRequest
    {
        std::string handle;
        std::string parent_handle;
        std::string encrypted_metadata_base64;
        std::string encrypted_crypt_key_base64;
        std::string signature_base64;
    };

    void to_json(nlohmann::json &json, const UploadFinaliseRequest &request);
    void from_json(const nlohmann::json &json, UploadFinaliseRequest &request);

    struct UploadFinaliseResponse
    {
        std::uint64_t size{};
        std::uint64_t container_size{};
    };

    void to_json(nlohmann::json &json, const UploadFinaliseResponse &response);
    void from_json(const nlohmann::json &json, UploadFinaliseResponse &response);

    struct HandleRequest
    {
        std::string handle;
    };

    void to_json(nlohmann::json &json, const HandleRequest &request);
    void from_json(const nlohmann::json &json, HandleRequest &request);

    struct DownloadChunkRequest
    {
        std::string handle;
        std::uint64_t chunk_id{};
    };

    void to_json(nlohmann::json &json, const DownloadChunkRequest &request);
    void from_json(const nlohmann::json &json, DownloadChunkRequest &request);

    struct DownloadChunkResponse
    {
        std::string handle;
        std::uint64_t chunk_id{};
        std::uint64_t bytes{};
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const DownloadChunkResponse &response);
    void from_json(const nlohmann::json &json, DownloadChunkResponse &response);

} // namespace treasury::protocol

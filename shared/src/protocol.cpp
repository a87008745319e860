#include "treasury/protocol.hpp"

#include <array>
#include <stdexcept>

namespace treasury::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 7> kCommandMappings{{
            {Command::Authenticate, "AUTHENTICATE"},
            {Command::UploadStart, "UPLOAD_START"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::UploadFinalise, "UPLOAD_FINALISE"},
            {Command::UploadCancel, "UPLOAD_CANCEL"},
            {Command::DownloadChunk, "DOWNLOAD_CHUNK"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        void read_request_id(const nlohmann::json &json, std::optional<std::string> &request_id)
        {
            if (auto it = json.find("id"); it != json.end())
            {
                request_id = it->get<std::string>();
            }
            else
            {
                request_id.reset();
            }
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        envelope.error = error_code_from_int(json.value("error", std::uint16_t{0}));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    void to_json(nlohmann::json &json, const AuthenticateRequest &request)
    {
        json = {{"token", request.token}};
    }

    void from_json(const nlohmann::json &json, AuthenticateRequest &request)
    {
        request.token = json.at("token").get<std::string>();
    }

    void to_json(nlohmann::json &json, const AuthenticateResponse &response)
    {
        json = {{"user_id", response.user_id}};
    }

    void from_json(const nlohmann::json &json, AuthenticateResponse &response)
    {
        response.user_id = json.at("user_id").get<std::uint64_t>();
    }

    void to_json(nlohmann::json &json, const UploadStartRequest &request)
    {
        json = {{"file_size", request.file_size}};
    }

    void from_json(const nlohmann::json &json, UploadStartRequest &request)
    {
        request.file_size = json.at("file_size").get<std::uint64_t>();
    }

    void to_json(nlohmann::json &json, const UploadStartResponse &response)
    {
        json = {
            {"handle", response.handle},
            {"chunk_count", response.chunk_count},
            {"container_size", response.container_size},
        };
    }

    void from_json(const nlohmann::json &json, UploadStartResponse &response)
    {
        response.handle = json.at("handle").get<std::string>();
        response.chunk_count = json.value("chunk_count", 0ULL);
        response.container_size = json.value("container_size", 0ULL);
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"handle", request.handle},
            {"chunk_id", request.chunk_id},
            {"data", request.data_base64},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.handle = json.at("handle").get<std::string>();
        request.chunk_id = json.at("chunk_id").get<std::uint64_t>();
        request.data_base64 = json.at("data").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadFinaliseRequest &request)
    {
        json = {
            {"handle", request.handle},
            {"parent_handle", request.parent_handle},
            {"encrypted_metadata", request.encrypted_metadata_base64},
            {"encrypted_crypt_key", request.encrypted_crypt_key_base64},
            {"signature", request.signature_base64},
        };
    }

    void from_json(const nlohmann::json &json, UploadFinaliseRequest &request)
    {
        request.handle = json.at("handle").get<std::string>();
        request.parent_handle = json.at("parent_handle").get<std::string>();
        request.encrypted_metadata_base64 = json.at("encrypted_metadata").get<std::string>();
        request.encrypted_crypt_key_base64 = json.at("encrypted_crypt_key").get<std::string>();
        request.signature_base64 = json.at("signature").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadFinaliseResponse &response)
    {
        json = {
            {"size", response.size},
            {"container_size", response.container_size},
        };
    }

    void from_json(const nlohmann::json &json, UploadFinaliseResponse &response)
    {
        response.size = json.at("size").get<std::uint64_t>();
        response.container_size = json.value("container_size", 0ULL);
    }

    void to_json(nlohmann::json &json, const HandleRequest &request)
    {
        json = {{"handle", request.handle}};
    }

    void from_json(const nlohmann::json &json, HandleRequest &request)
    {
        request.handle = json.at("handle").get<std::string>();
    }

    void to_json(nlohmann::json &json, const DownloadChunkRequest &request)
    {
        json = {
            {"handle", request.handle},
            {"chunk_id", request.chunk_id},
        };
    }

    void from_json(const nlohmann::json &json, DownloadChunkRequest &request)
    {
        request.handle = json.at("handle").get<std::string>();
        request.chunk_id = json.at("chunk_id").get<std::uint64_t>();
    }

    void to_json(nlohmann::json &json, const DownloadChunkResponse &response)
    {
        json = {
            {"handle", response.handle},
            {"chunk_id", response.chunk_id},
            {"bytes", response.bytes},
            {"data", response.data_base64},
        };
    }

    void from_json(const nlohmann::json &json, DownloadChunkResponse &response)
    {
        response.handle = json.at("handle").get<std::string>();
        response.chunk_id = json.at("chunk_id").get<std::uint64_t>();
        response.bytes = json.value("bytes", 0ULL);
        response.data_base64 = json.at("data").get<std::string>();
    }

} // namespace treasury::protocol

#include "treasury/server/transfer_service.hpp"

#include <spdlog/spdlog.h>

#include "treasury/chunk_format.hpp"
#include "treasury/crypto.hpp"

namespace treasury::server
{

    namespace
    {
        constexpr int kHandleAttempts = 8;

        void require_valid_handle(const std::string &handle)
        {
            if (!format::is_valid_handle(handle))
            {
                throw TransferError(ErrorCode::InvalidPayload, "Malformed handle");
            }
        }
    } // namespace

    void validate_finalize_request(const FinalizeRequest &request)
    {
        if (!format::is_valid_handle(request.parent_handle))
        {
            throw TransferError(ErrorCode::InvalidPayload, "Malformed parent handle");
        }
        if (request.fields.metadata.size() > kMaxEncryptedMetadataSize)
        {
            throw TransferError(ErrorCode::InvalidPayload, "Encrypted metadata is too large");
        }
        if (request.fields.crypt_key.size() != kEncryptedCryptKeySize)
        {
            throw TransferError(ErrorCode::InvalidPayload,
                                "Encrypted file key must be " + std::to_string(kEncryptedCryptKeySize) + " bytes");
        }
        if (request.fields.signature.size() != kSignatureSize)
        {
            throw TransferError(ErrorCode::InvalidPayload,
                                "Signature must be " + std::to_string(kSignatureSize) + " bytes");
        }
    }

    TransferService::TransferService(UploadsManager &uploads, DownloadsManager &downloads, FileRecordStore &records)
        : uploads_(uploads), downloads_(downloads), records_(records)
    {
    }

    UploadTicket TransferService::open_upload(UserId user, std::uint64_t declared_size)
    {
        if (declared_size > format::kMaxFileSize)
        {
            throw TransferError(ErrorCode::InvalidPayload, "File size exceeds the supported maximum");
        }

        for (int attempt = 0; attempt < kHandleAttempts; ++attempt)
        {
            auto handle = crypto::generate_handle(format::kHandleLength);
            if (records_.find(handle))
            {
                continue;
            }
            try
            {
                uploads_.open(user, handle, declared_size);
            }
            catch (const TransferError &ex)
            {
                if (ex.code() == ErrorCode::Conflict)
                {
                    continue;
                }
                throw;
            }
            return UploadTicket{
                .handle = std::move(handle),
                .chunk_count = format::chunk_count(declared_size),
                .container_size = format::encrypted_container_size(declared_size),
            };
        }
        throw TransferError(ErrorCode::InternalError, "Could not allocate a unique handle");
    }

    std::size_t TransferService::accept_chunk(UserId user, const std::string &handle, std::uint64_t chunk_id,
                                              std::vector<std::byte> data)
    {
        require_valid_handle(handle);
        require_upload_owner(user, handle);
        try
        {
            return uploads_.accept_chunk(handle, chunk_id, std::move(data));
        }
        catch (const TransferError &ex)
        {
            if (is_client_error(ex.code()))
            {
                spdlog::warn("Rejected chunk {} of {}: {}", chunk_id, handle, ex.what());
            }
            throw;
        }
    }

    FinalizedUpload TransferService::finalize_upload(UserId user, const std::string &handle, FinalizeRequest request)
    {
        require_valid_handle(handle);
        require_upload_owner(user, handle);
        validate_finalize_request(request);

        auto finalized = uploads_.finalize(handle);
        try
        {
            records_.insert_file_record(finalized.owner, handle, request.parent_handle, finalized.raw_size,
                                        std::move(request.fields));
        }
        catch (const TransferError &ex)
        {
            spdlog::error("Stored {} but could not record it: {}", handle, ex.what());
            throw;
        }
        return finalized;
    }

    void TransferService::cancel_upload(UserId user, const std::string &handle)
    {
        require_valid_handle(handle);
        require_upload_owner(user, handle);
        uploads_.cancel(handle);
    }

    ChunkStream TransferService::read_download_chunk(UserId user, const std::string &handle, std::uint64_t chunk_id)
    {
        require_valid_handle(handle);
        const auto record = records_.find(handle);
        if (!record || record->owner != user)
        {
            throw TransferError(ErrorCode::FileNotFound, "File not found");
        }
        return downloads_.read_chunk_stream(user, handle, chunk_id);
    }

    void TransferService::require_upload_owner(UserId user, const std::string &handle) const
    {
        if (uploads_.owner_of(handle) != user)
        {
            spdlog::warn("User {} tried to use upload {} owned by someone else", user, handle);
            throw TransferError(ErrorCode::PermissionDenied, "Upload belongs to another user");
        }
    }

} // namespace treasury::server

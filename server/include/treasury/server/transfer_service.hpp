#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "treasury/server/chunk_stream.hpp"
#include "treasury/server/downloads_manager.hpp"
#include "treasury/server/file_record_store.hpp"
#include "treasury/server/uploads_manager.hpp"

namespace treasury::server
{

    inline constexpr std::size_t kMaxEncryptedMetadataSize = 1024;
    inline constexpr std::size_t kEncryptedCryptKeySize = 72;
    inline constexpr std::size_t kSignatureSize = 64;

    struct UploadTicket
    {
        std::string handle;
        std::uint64_t chunk_count{};
        std::uint64_t container_size{};
    };

    struct FinalizeRequest
    {
        std::string parent_handle;
        EncryptedFields fields;
    };

    /**
     * Operation surface used by the transport. Validates requests, enforces that a
     * caller only touches its own transfers and forwards to the managers. Every
     * failure is reported as a TransferError.
     */
    class TransferService
    {
    public:
        TransferService(UploadsManager &uploads, DownloadsManager &downloads, FileRecordStore &records);

        UploadTicket open_upload(UserId user, std::uint64_t declared_size);

        std::size_t accept_chunk(UserId user, const std::string &handle, std::uint64_t chunk_id,
                                 std::vector<std::byte> data);

        FinalizedUpload finalize_upload(UserId user, const std::string &handle, FinalizeRequest request);

        void cancel_upload(UserId user, const std::string &handle);

        // Unknown handles and handles owned by someone else both read as FileNotFound.
        ChunkStream read_download_chunk(UserId user, const std::string &handle, std::uint64_t chunk_id);

    private:
        void require_upload_owner(UserId user, const std::string &handle) const;

        UploadsManager &uploads_;
        DownloadsManager &downloads_;
        FileRecordStore &records_;
    };

    void validate_finalize_request(const FinalizeRequest &request);

} // namespace treasury::server

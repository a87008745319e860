#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "treasury/server/transfer_error.hpp"

namespace treasury::server
{

    // Client-encrypted blobs stored beside a file; the server never interprets them.
    struct EncryptedFields
    {
        std::vector<std::byte> metadata;
        std::vector<std::byte> crypt_key;
        std::vector<std::byte> signature;
    };

    struct FileRecord
    {
        std::string handle;
        UserId owner{};
        std::string parent_handle;
        std::uint64_t size{};
        EncryptedFields fields;
    };

    class FileRecordStore
    {
    public:
        virtual ~FileRecordStore() = default;

        // Throws TransferError(Conflict) when the handle is already recorded.
        virtual void insert_file_record(UserId owner, const std::string &handle, const std::string &parent_handle,
                                        std::uint64_t size, EncryptedFields fields) = 0;

        virtual std::optional<FileRecord> find(const std::string &handle) const = 0;
    };

    /// Keeps every record in one JSON document, rewritten through a temporary file
    /// on each insert. Loaded on first use.
    class JsonFileRecordStore final : public FileRecordStore
    {
    public:
        explicit JsonFileRecordStore(std::filesystem::path database_path);

        void insert_file_record(UserId owner, const std::string &handle, const std::string &parent_handle,
                                std::uint64_t size, EncryptedFields fields) override;

        std::optional<FileRecord> find(const std::string &handle) const override;

        std::size_t size() const;

    private:
        void load_locked() const;
        void persist_locked() const;

        std::filesystem::path database_path_;

        mutable std::mutex mutex_;
        mutable bool loaded_{false};
        mutable std::unordered_map<std::string, FileRecord> records_;
    };

} // namespace treasury::server

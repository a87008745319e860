#include "treasury/server/file_record_store.hpp"

#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "treasury/encoding/base64.hpp"

namespace treasury::server
{

    namespace
    {

        std::vector<std::byte> decode_field(const nlohmann::json &json, const char *key)
        {
            auto decoded = encoding::decode_base64(json.at(key).get<std::string>());
            if (!decoded)
            {
                throw TransferError(ErrorCode::InternalError, std::string("Corrupt record field: ") + key);
            }
            return std::move(*decoded);
        }

        nlohmann::json record_to_json(const FileRecord &record)
        {
            return {
                {"owner", record.owner},
                {"parent_handle", record.parent_handle},
                {"size", record.size},
                {"encrypted_metadata", encoding::encode_base64(record.fields.metadata)},
                {"encrypted_crypt_key", encoding::encode_base64(record.fields.crypt_key)},
                {"signature", encoding::encode_base64(record.fields.signature)},
            };
        }

        FileRecord record_from_json(const std::string &handle, const nlohmann::json &json)
        {
            FileRecord record{};
            record.handle = handle;
            record.owner = json.at("owner").get<UserId>();
            record.parent_handle = json.value("parent_handle", std::string{});
            record.size = json.value("size", 0ULL);
            record.fields.metadata = decode_field(json, "encrypted_metadata");
            record.fields.crypt_key = decode_field(json, "encrypted_crypt_key");
            record.fields.signature = decode_field(json, "signature");
            return record;
        }

    } // namespace

    JsonFileRecordStore::JsonFileRecordStore(std::filesystem::path database_path)
        : database_path_(std::move(database_path))
    {
        if (database_path_.has_parent_path())
        {
            std::filesystem::create_directories(database_path_.parent_path());
        }
    }

    void JsonFileRecordStore::insert_file_record(UserId owner, const std::string &handle,
                                                 const std::string &parent_handle, std::uint64_t size,
                                                 EncryptedFields fields)
    {
        std::lock_guard lock(mutex_);
        load_locked();
        if (records_.contains(handle))
        {
            throw TransferError(ErrorCode::Conflict, "A file with this handle already exists");
        }
        records_.emplace(handle, FileRecord{
                                     .handle = handle,
                                     .owner = owner,
                                     .parent_handle = parent_handle,
                                     .size = size,
                                     .fields = std::move(fields),
                                 });
        try
        {
            persist_locked();
        }
        catch (const TransferError &)
        {
            records_.erase(handle);
            throw;
        }
    }

    std::optional<FileRecord> JsonFileRecordStore::find(const std::string &handle) const
    {
        std::lock_guard lock(mutex_);
        load_locked();
        auto it = records_.find(handle);
        if (it == records_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t JsonFileRecordStore::size() const
    {
        std::lock_guard lock(mutex_);
        load_locked();
        return records_.size();
    }

    void JsonFileRecordStore::load_locked() const
    {
        if (loaded_)
        {
            return;
        }
        records_.clear();
        if (std::filesystem::exists(database_path_))
        {
            std::ifstream in(database_path_);
            if (!in.is_open())
            {
                throw TransferError(ErrorCode::IoError, "Failed to open " + database_path_.string());
            }
            try
            {
                nlohmann::json json;
                in >> json;
                if (json.is_object())
                {
                    for (const auto &[handle, value] : json.items())
                    {
                        records_.emplace(handle, record_from_json(handle, value));
                    }
                }
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw TransferError(ErrorCode::InternalError,
                                    "Failed to parse " + database_path_.string() + ": " + ex.what());
            }
            spdlog::info("Loaded {} file records from {}", records_.size(), database_path_.string());
        }
        loaded_ = true;
    }

    void JsonFileRecordStore::persist_locked() const
    {
        nlohmann::json json = nlohmann::json::object();
        for (const auto &[handle, record] : records_)
        {
            json[handle] = record_to_json(record);
        }

        auto temp_path = database_path_;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            out << json.dump(2);
            out.flush();
            if (!out)
            {
                throw TransferError(ErrorCode::IoError, "Failed to write " + temp_path.string());
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp_path, database_path_, ec);
        if (ec)
        {
            spdlog::error("Failed to replace {}: {}", database_path_.string(), ec.message());
            throw TransferError(ErrorCode::IoError, "Failed to update file records: " + ec.message());
        }
    }

} // namespace treasury::server

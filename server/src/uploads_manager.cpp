#include "treasury/server/uploads_manager.hpp"

#include <functional>
#include <utility>

#include <spdlog/spdlog.h>

#include "treasury/chunk_format.hpp"

namespace treasury::server
{

    UploadsManager::UploadsManager(std::filesystem::path upload_dir, std::filesystem::path storage_dir,
                                   std::size_t max_pending_chunks)
        : upload_dir_(std::move(upload_dir)),
          storage_dir_(std::move(storage_dir)),
          max_pending_chunks_(max_pending_chunks)
    {
        std::filesystem::create_directories(upload_dir_);
        std::filesystem::create_directories(storage_dir_);
    }

    UploadsManager::Shard &UploadsManager::shard_for(const std::string &handle)
    {
        return shards_[std::hash<std::string>{}(handle) % kShardCount];
    }

    const UploadsManager::Shard &UploadsManager::shard_for(const std::string &handle) const
    {
        return shards_[std::hash<std::string>{}(handle) % kShardCount];
    }

    std::filesystem::path UploadsManager::temp_path_for(const std::string &handle) const
    {
        return upload_dir_ / (handle + std::string(format::kContainerExtension));
    }

    std::filesystem::path UploadsManager::storage_path_for(const std::string &handle) const
    {
        return storage_dir_ / (handle + std::string(format::kContainerExtension));
    }

    void UploadsManager::open(UserId owner, const std::string &handle, std::uint64_t declared_size)
    {
        if (declared_size > format::kMaxFileSize)
        {
            throw TransferError(ErrorCode::InvalidPayload, "File size exceeds the supported maximum");
        }

        auto session = std::make_shared<UploadSession>(handle, owner, temp_path_for(handle), declared_size);
        auto &shard = shard_for(handle);
        {
            std::lock_guard lock(shard.mutex);
            if (shard.sessions.contains(handle))
            {
                throw TransferError(ErrorCode::Conflict, "Upload handle is already in use");
            }
            shard.sessions.emplace(handle, session);
        }

        try
        {
            session->open();
        }
        catch (const TransferError &)
        {
            remove(handle, session.get());
            throw;
        }

        spdlog::info("Upload {} opened by user {} ({} bytes, {} chunks)", handle, owner, declared_size,
                     format::chunk_count(declared_size));
    }

    std::size_t UploadsManager::accept_chunk(const std::string &handle, std::uint64_t chunk_id,
                                             std::vector<std::byte> data)
    {
        auto session = find_or_throw(handle);
        const auto flushed = session->accept_chunk(chunk_id, std::move(data), max_pending_chunks_);
        spdlog::debug("Upload {} accepted chunk {} ({} written)", handle, chunk_id, flushed);
        return flushed;
    }

    FinalizedUpload UploadsManager::finalize(const std::string &handle)
    {
        auto session = find_or_throw(handle);
        session->begin_finalize();
        remove(handle, session.get());

        const auto final_path = storage_path_for(handle);
        try
        {
            session->close_for_finalize();
        }
        catch (const TransferError &ex)
        {
            spdlog::error("Finalizing upload {} failed: {}", handle, ex.what());
            session->discard();
            throw;
        }

        std::error_code ec;
        std::filesystem::rename(session->temp_path(), final_path, ec);
        if (ec)
        {
            spdlog::error("Moving upload {} into storage failed: {}", handle, ec.message());
            throw TransferError(ErrorCode::FinalizeIoError, "Failed to move upload into storage: " + ec.message());
        }

        FinalizedUpload result{
            .handle = handle,
            .owner = session->owner(),
            .path = final_path,
            .raw_size = session->declared_size(),
            .container_size = format::encrypted_container_size(session->declared_size()),
        };
        spdlog::info("Upload {} finalized ({} bytes stored)", handle, result.container_size);
        return result;
    }

    void UploadsManager::cancel(const std::string &handle)
    {
        auto session = find_or_throw(handle);
        if (!session->claim(std::nullopt))
        {
            throw TransferError(ErrorCode::AlreadyFinalizing, "Upload is being finalized");
        }
        remove(handle, session.get());
        session->discard();
        spdlog::info("Upload {} cancelled", handle);
    }

    UserId UploadsManager::owner_of(const std::string &handle) const
    {
        return find_or_throw(handle)->owner();
    }

    std::optional<UploadProgress> UploadsManager::progress(const std::string &handle) const
    {
        const auto &shard = shard_for(handle);
        std::shared_ptr<UploadSession> session;
        {
            std::lock_guard lock(shard.mutex);
            auto it = shard.sessions.find(handle);
            if (it == shard.sessions.end())
            {
                return std::nullopt;
            }
            session = it->second;
        }
        return session->progress();
    }

    std::size_t UploadsManager::expire_idle(std::chrono::seconds max_idle, UploadSession::Clock::time_point now)
    {
        const auto idle_before = now - max_idle;
        std::vector<std::shared_ptr<UploadSession>> expired;
        for (auto &shard : shards_)
        {
            std::lock_guard lock(shard.mutex);
            for (auto it = shard.sessions.begin(); it != shard.sessions.end();)
            {
                if (it->second->claim(idle_before))
                {
                    expired.push_back(std::move(it->second));
                    it = shard.sessions.erase(it);
                }
                else
                {
                    ++it;
                }
            }
        }

        for (const auto &session : expired)
        {
            spdlog::info("Upload {} expired after {}s without activity", session->handle(), max_idle.count());
            session->discard();
        }
        return expired.size();
    }

    std::size_t UploadsManager::purge_orphaned_files()
    {
        std::size_t removed = 0;
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(upload_dir_, ec))
        {
            if (!entry.is_regular_file() || entry.path().extension().string() != format::kContainerExtension)
            {
                continue;
            }
            const auto handle = entry.path().stem().string();
            {
                const auto &shard = shard_for(handle);
                std::lock_guard lock(shard.mutex);
                if (shard.sessions.contains(handle))
                {
                    continue;
                }
            }
            std::error_code remove_ec;
            if (std::filesystem::remove(entry.path(), remove_ec))
            {
                ++removed;
            }
            else if (remove_ec)
            {
                spdlog::warn("Failed to delete orphaned upload {}: {}", entry.path().string(), remove_ec.message());
            }
        }
        if (ec)
        {
            spdlog::warn("Failed to scan upload directory {}: {}", upload_dir_.string(), ec.message());
        }
        if (removed > 0)
        {
            spdlog::info("Removed {} orphaned upload files", removed);
        }
        return removed;
    }

    std::size_t UploadsManager::active_count() const
    {
        std::size_t count = 0;
        for (const auto &shard : shards_)
        {
            std::lock_guard lock(shard.mutex);
            count += shard.sessions.size();
        }
        return count;
    }

    std::shared_ptr<UploadSession> UploadsManager::find_or_throw(const std::string &handle) const
    {
        const auto &shard = shard_for(handle);
        std::lock_guard lock(shard.mutex);
        auto it = shard.sessions.find(handle);
        if (it == shard.sessions.end())
        {
            throw TransferError(ErrorCode::UnknownHandle, "Unknown upload handle");
        }
        return it->second;
    }

    void UploadsManager::remove(const std::string &handle, const UploadSession *session)
    {
        auto &shard = shard_for(handle);
        std::lock_guard lock(shard.mutex);
        auto it = shard.sessions.find(handle);
        if (it != shard.sessions.end() && it->second.get() == session)
        {
            shard.sessions.erase(it);
        }
    }

} // namespace treasury::server

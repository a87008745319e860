#include "treasury/server/downloads_manager.hpp"

#include <tuple>
#include <utility>

#include <asio/error.hpp>
#include <asio/post.hpp>
#include <spdlog/spdlog.h>

#include "treasury/chunk_format.hpp"

namespace treasury::server
{

    DownloadsManager::DownloadsManager(asio::io_context &io_context, std::filesystem::path storage_dir,
                                       std::chrono::milliseconds idle_timeout)
        : strand_(asio::make_strand(io_context)),
          storage_dir_(std::move(storage_dir)),
          idle_timeout_(idle_timeout)
    {
    }

    ChunkStream DownloadsManager::read_chunk_stream(UserId user, const std::string &handle, std::uint64_t chunk_id)
    {
        if (!format::is_valid_handle(handle))
        {
            throw TransferError(ErrorCode::FileNotFound, "File not found");
        }

        auto file = touch(handle);
        const auto range = format::chunk_read_range(chunk_id, file->size());
        if (!range)
        {
            throw TransferError(ErrorCode::ChunkOutOfRange,
                                "Chunk " + std::to_string(chunk_id) + " is past the end of the file");
        }

        spdlog::debug("User {} reads chunk {} of {} ({} bytes at offset {})", user, chunk_id, handle, range->length,
                      range->offset);
        return ChunkStream(std::move(file), *range);
    }

    std::shared_ptr<const OpenFile> DownloadsManager::touch(const std::string &handle)
    {
        std::unique_lock lock(mutex_);
        if (stopped_)
        {
            throw TransferError(ErrorCode::IoError, "Downloads are shut down");
        }

        auto it = files_.find(handle);
        if (it == files_.end())
        {
            lock.unlock();
            auto opened = OpenFile::open(storage_dir_ / (handle + std::string(format::kContainerExtension)));
            lock.lock();
            if (stopped_)
            {
                throw TransferError(ErrorCode::IoError, "Downloads are shut down");
            }
            bool inserted = false;
            std::tie(it, inserted) = files_.try_emplace(handle, CachedFile{.file = std::move(opened)});
            if (inserted)
            {
                spdlog::debug("Opened {} for download ({} bytes)", handle, it->second.file->size());
            }
        }

        const auto generation = ++last_generation_;
        it->second.generation = generation;
        // Posted under the lock so the strand sees accesses in generation order.
        asio::post(strand_, [this, handle, generation] { arm_timer(handle, generation); });
        return it->second.file;
    }

    void DownloadsManager::arm_timer(const std::string &handle, std::uint64_t generation)
    {
        {
            std::lock_guard lock(mutex_);
            auto it = files_.find(handle);
            if (stopped_ || it == files_.end() || it->second.generation != generation)
            {
                return;
            }
        }

        auto &timer = timers_[handle];
        if (!timer)
        {
            timer = std::make_unique<asio::steady_timer>(strand_);
        }
        timer->expires_after(idle_timeout_);
        timer->async_wait([this, handle, generation](const std::error_code &ec)
                          {
            if (ec == asio::error::operation_aborted)
            {
                return;
            }
            on_idle(handle, generation); });
    }

    void DownloadsManager::on_idle(const std::string &handle, std::uint64_t generation)
    {
        {
            std::lock_guard lock(mutex_);
            auto it = files_.find(handle);
            if (it == files_.end() || it->second.generation != generation)
            {
                return;
            }
            files_.erase(it);
        }
        timers_.erase(handle);
        spdlog::debug("Closed idle download {}", handle);
    }

    bool DownloadsManager::is_cached(const std::string &handle) const
    {
        std::lock_guard lock(mutex_);
        return files_.contains(handle);
    }

    std::size_t DownloadsManager::cached_count() const
    {
        std::lock_guard lock(mutex_);
        return files_.size();
    }

    void DownloadsManager::shutdown()
    {
        {
            std::lock_guard lock(mutex_);
            if (stopped_)
            {
                return;
            }
            stopped_ = true;
            files_.clear();
        }
        asio::post(strand_, [this] { timers_.clear(); });
        spdlog::info("Download cache closed");
    }

} // namespace treasury::server

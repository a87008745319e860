#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include "treasury/server/chunk_stream.hpp"
#include "treasury/server/transfer_error.hpp"

namespace treasury::server
{

    /**
     * Caches open containers for download and closes them after a period without
     * access.
     *
     * Every access bumps the handle's generation and posts a re-arm of its idle timer
     * to a strand. The strand is the only place timers are touched; an expiring timer
     * evicts the handle only when no access happened after it was armed.
     *
     * The io_context must be stopped before the manager is destroyed.
     */
    class DownloadsManager
    {
    public:
        DownloadsManager(asio::io_context &io_context, std::filesystem::path storage_dir,
                         std::chrono::milliseconds idle_timeout);

        DownloadsManager(const DownloadsManager &) = delete;
        DownloadsManager &operator=(const DownloadsManager &) = delete;

        ChunkStream read_chunk_stream(UserId user, const std::string &handle, std::uint64_t chunk_id);

        bool is_cached(const std::string &handle) const;
        std::size_t cached_count() const;

        void shutdown();

    private:
        struct CachedFile
        {
            std::shared_ptr<const OpenFile> file;
            std::uint64_t generation{0};
        };

        std::shared_ptr<const OpenFile> touch(const std::string &handle);

        // Strand only.
        void arm_timer(const std::string &handle, std::uint64_t generation);
        void on_idle(const std::string &handle, std::uint64_t generation);

        asio::strand<asio::io_context::executor_type> strand_;
        std::filesystem::path storage_dir_;
        std::chrono::milliseconds idle_timeout_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, CachedFile> files_;
        std::uint64_t last_generation_{0};
        bool stopped_{false};

        std::unordered_map<std::string, std::unique_ptr<asio::steady_timer>> timers_;
    };

} // namespace treasury::server

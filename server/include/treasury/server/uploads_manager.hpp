#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "treasury/server/upload_session.hpp"

namespace treasury::server
{

    /**
     * Registry of in-progress uploads keyed by handle.
     *
     * Sessions live in a fixed set of shards so unrelated handles never contend on
     * the same lock. A shard lock is held only while looking a session up; chunk
     * reordering and file writes happen under the per-session mutex.
     */
    class UploadsManager
    {
    public:
        UploadsManager(std::filesystem::path upload_dir, std::filesystem::path storage_dir,
                       std::size_t max_pending_chunks);

        // Registers a new session and creates its temporary container file.
        void open(UserId owner, const std::string &handle, std::uint64_t declared_size);

        std::size_t accept_chunk(const std::string &handle, std::uint64_t chunk_id, std::vector<std::byte> data);

        /// Completes the upload and moves the container into storage. The session is
        /// gone once the latch has been taken, whether or not the move succeeds.
        FinalizedUpload finalize(const std::string &handle);

        void cancel(const std::string &handle);

        UserId owner_of(const std::string &handle) const;

        std::optional<UploadProgress> progress(const std::string &handle) const;

        // Drops sessions that saw no chunk for `max_idle`. Returns how many were dropped.
        std::size_t expire_idle(std::chrono::seconds max_idle,
                                UploadSession::Clock::time_point now = UploadSession::Clock::now());

        // Deletes temporary files left behind by a previous process.
        std::size_t purge_orphaned_files();

        std::size_t active_count() const;

        std::filesystem::path temp_path_for(const std::string &handle) const;
        std::filesystem::path storage_path_for(const std::string &handle) const;

    private:
        struct Shard
        {
            mutable std::mutex mutex;
            std::unordered_map<std::string, std::shared_ptr<UploadSession>> sessions;
        };

        static constexpr std::size_t kShardCount = 16;

        Shard &shard_for(const std::string &handle);
        const Shard &shard_for(const std::string &handle) const;

        std::shared_ptr<UploadSession> find_or_throw(const std::string &handle) const;

        // Removes `handle` only while it still maps to `session`.
        void remove(const std::string &handle, const UploadSession *session);

        std::filesystem::path upload_dir_;
        std::filesystem::path storage_dir_;
        std::size_t max_pending_chunks_;
        std::array<Shard, kShardCount> shards_;
    };

} // namespace treasury::server

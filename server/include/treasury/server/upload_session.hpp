#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "treasury/server/transfer_error.hpp"

namespace treasury::server
{

    struct FinalizedUpload
    {
        std::string handle;
        UserId owner{};
        std::filesystem::path path;
        std::uint64_t raw_size{};
        std::uint64_t container_size{};
    };

    struct UploadProgress
    {
        std::uint64_t declared_size{};
        std::uint64_t written_bytes{};
        std::uint64_t next_chunk_id{};
        std::size_t pending_chunks{};
        bool finalize_in_progress{};
    };

    /**
     * One in-progress upload. Owns the temporary container file exclusively and
     * reorders chunks so they reach the file strictly by ascending chunk id.
     * Every public member takes the session mutex.
     */
    class UploadSession
    {
    public:
        using Clock = std::chrono::steady_clock;

        UploadSession(std::string handle, UserId owner, std::filesystem::path temp_path, std::uint64_t declared_size);

        UploadSession(const UploadSession &) = delete;
        UploadSession &operator=(const UploadSession &) = delete;

        // Creates the temporary file and writes the container header.
        void open();

        /// Buffers `data` as chunk `chunk_id` and writes every chunk that is now in
        /// sequence. Returns how many chunks reached the file during this call.
        std::size_t accept_chunk(std::uint64_t chunk_id, std::vector<std::byte> data, std::size_t max_pending);

        /// Sets the finalize latch after checking the upload is complete. The latch is
        /// released again when the upload turns out to be incomplete.
        void begin_finalize();

        // Flushes and closes the file. Requires begin_finalize().
        void close_for_finalize();

        /// Sets the finalize latch unless it is already set, optionally only when the
        /// session has been idle since `idle_before`. Used by cancel and expiry.
        bool claim(std::optional<Clock::time_point> idle_before);

        // Closes the stream and deletes the temporary file. Requires claim().
        void discard();

        const std::string &handle() const noexcept { return handle_; }
        UserId owner() const noexcept { return owner_; }
        const std::filesystem::path &temp_path() const noexcept { return temp_path_; }
        std::uint64_t declared_size() const noexcept { return declared_size_; }

        UploadProgress progress() const;

    private:
        std::size_t flush_pending_locked();

        const std::string handle_;
        const UserId owner_;
        const std::filesystem::path temp_path_;
        const std::uint64_t declared_size_;

        mutable std::mutex mutex_;
        std::ofstream out_;
        std::uint64_t written_bytes_{0};
        std::uint64_t next_chunk_id_{0};
        std::map<std::uint64_t, std::vector<std::byte>> pending_chunks_;
        bool finalize_in_progress_{false};
        bool write_failed_{false};
        Clock::time_point last_activity_;
    };

} // namespace treasury::server

#include "treasury/server/upload_session.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "treasury/chunk_format.hpp"

namespace treasury::server
{

    UploadSession::UploadSession(std::string handle, UserId owner, std::filesystem::path temp_path,
                                 std::uint64_t declared_size)
        : handle_(std::move(handle)),
          owner_(owner),
          temp_path_(std::move(temp_path)),
          declared_size_(declared_size),
          last_activity_(Clock::now())
    {
    }

    void UploadSession::open()
    {
        std::lock_guard lock(mutex_);
        out_.open(temp_path_, std::ios::binary | std::ios::out | std::ios::trunc);
        if (!out_.is_open())
        {
            throw TransferError(ErrorCode::IoError, "Failed to create upload file " + temp_path_.string());
        }
        out_.write(reinterpret_cast<const char *>(format::kContainerMagic.data()),
                   static_cast<std::streamsize>(format::kContainerMagic.size()));
        if (!out_)
        {
            out_.close();
            std::error_code ec;
            std::filesystem::remove(temp_path_, ec);
            throw TransferError(ErrorCode::IoError, "Failed to write container header to " + temp_path_.string());
        }
        last_activity_ = Clock::now();
    }

    std::size_t UploadSession::accept_chunk(std::uint64_t chunk_id, std::vector<std::byte> data, std::size_t max_pending)
    {
        std::lock_guard lock(mutex_);
        if (finalize_in_progress_)
        {
            throw TransferError(ErrorCode::AlreadyFinalizing, "Upload is being finalized");
        }
        if (write_failed_)
        {
            throw TransferError(ErrorCode::IoError, "Upload is unusable after a write failure");
        }
        if (pending_chunks_.contains(chunk_id))
        {
            throw TransferError(ErrorCode::DuplicateChunk, "Chunk " + std::to_string(chunk_id) + " is already buffered");
        }
        if (chunk_id < next_chunk_id_)
        {
            throw TransferError(ErrorCode::StaleChunk, "Chunk " + std::to_string(chunk_id) + " was already written");
        }

        const auto expected_size = format::expected_encrypted_chunk_size(declared_size_, chunk_id);
        if (!expected_size)
        {
            throw TransferError(ErrorCode::ChunkOutOfRange,
                                "Chunk " + std::to_string(chunk_id) + " is past the end of a " +
                                    std::to_string(declared_size_) + " byte file");
        }
        if (data.size() != *expected_size)
        {
            throw TransferError(ErrorCode::ChunkSizeMismatch,
                                "Expected encrypted chunk size " + std::to_string(*expected_size) + " but got " +
                                    std::to_string(data.size()));
        }

        // The next expected chunk drains immediately, so it never grows the buffer.
        if (pending_chunks_.size() >= max_pending && chunk_id != next_chunk_id_)
        {
            throw TransferError(ErrorCode::TooManyPendingChunks,
                                "Reached the maximum of " + std::to_string(max_pending) + " buffered chunks");
        }

        pending_chunks_.emplace(chunk_id, std::move(data));
        last_activity_ = Clock::now();
        return flush_pending_locked();
    }

    std::size_t UploadSession::flush_pending_locked()
    {
        std::size_t flushed = 0;
        while (!pending_chunks_.empty() && pending_chunks_.begin()->first == next_chunk_id_)
        {
            const auto it = pending_chunks_.begin();
            const auto &chunk = it->second;

            const auto bytes_left = declared_size_ - written_bytes_;
            const auto expected_size = std::min(format::kChunkDataSize, bytes_left) + format::kChunkOverhead;
            if (bytes_left == 0 || chunk.size() != expected_size)
            {
                const auto received = chunk.size();
                pending_chunks_.erase(it);
                throw TransferError(ErrorCode::ChunkSizeMismatch,
                                    "Expected encrypted chunk size " + std::to_string(expected_size) + " but got " +
                                        std::to_string(received));
            }

            out_.write(reinterpret_cast<const char *>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
            if (!out_)
            {
                write_failed_ = true;
                spdlog::error("Write of chunk {} to {} failed", next_chunk_id_, temp_path_.string());
                throw TransferError(ErrorCode::IoError, "Failed to write chunk to upload file");
            }

            written_bytes_ += format::raw_chunk_size(chunk.size());
            ++next_chunk_id_;
            ++flushed;
            pending_chunks_.erase(it);
        }
        return flushed;
    }

    void UploadSession::begin_finalize()
    {
        std::lock_guard lock(mutex_);
        if (finalize_in_progress_)
        {
            throw TransferError(ErrorCode::AlreadyFinalizing, "Upload is already being finalized");
        }
        if (write_failed_)
        {
            throw TransferError(ErrorCode::IoError, "Upload is unusable after a write failure");
        }
        if (written_bytes_ != declared_size_ || !pending_chunks_.empty())
        {
            const auto remaining = declared_size_ - written_bytes_;
            throw TransferError(ErrorCode::IncompleteUpload,
                                std::to_string(remaining) + " bytes are still missing", remaining);
        }
        finalize_in_progress_ = true;
    }

    void UploadSession::close_for_finalize()
    {
        std::lock_guard lock(mutex_);
        out_.flush();
        const bool flushed = static_cast<bool>(out_);
        out_.close();
        if (!flushed || out_.fail())
        {
            throw TransferError(ErrorCode::FinalizeIoError, "Failed to flush upload file " + temp_path_.string());
        }
    }

    bool UploadSession::claim(std::optional<Clock::time_point> idle_before)
    {
        std::lock_guard lock(mutex_);
        if (finalize_in_progress_)
        {
            return false;
        }
        if (idle_before && last_activity_ > *idle_before)
        {
            return false;
        }
        finalize_in_progress_ = true;
        return true;
    }

    void UploadSession::discard()
    {
        std::lock_guard lock(mutex_);
        pending_chunks_.clear();
        out_.close();
        std::error_code ec;
        std::filesystem::remove(temp_path_, ec);
        if (ec)
        {
            spdlog::warn("Failed to delete upload file {}: {}", temp_path_.string(), ec.message());
        }
    }

    UploadProgress UploadSession::progress() const
    {
        std::lock_guard lock(mutex_);
        return UploadProgress{
            .declared_size = declared_size_,
            .written_bytes = written_bytes_,
            .next_chunk_id = next_chunk_id_,
            .pending_chunks = pending_chunks_.size(),
            .finalize_in_progress = finalize_in_progress_,
        };
    }

} // namespace treasury::server

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <vector>

#include "treasury/chunk_format.hpp"

namespace treasury::server
{

    /**
     * Read-only descriptor of a stored container. The size is captured once at open
     * time; reads are positioned, so any number of streams can share one descriptor.
     */
    class OpenFile
    {
        struct Passkey
        {
            explicit Passkey() = default;
        };

    public:
        OpenFile(Passkey, int fd, std::uint64_t size, std::filesystem::path path) noexcept;

        // Throws TransferError(FileNotFound) when the file does not exist.
        static std::shared_ptr<const OpenFile> open(const std::filesystem::path &path);

        ~OpenFile();

        OpenFile(const OpenFile &) = delete;
        OpenFile &operator=(const OpenFile &) = delete;

        std::uint64_t size() const noexcept { return size_; }
        const std::filesystem::path &path() const noexcept { return path_; }

        // Returns the number of bytes read; 0 means end of file.
        std::size_t read_at(std::uint64_t offset, std::span<std::byte> buffer) const;

    private:
        int fd_;
        std::uint64_t size_;
        std::filesystem::path path_;
    };

    /// Lazily produced bytes of one chunk. The stream keeps the file alive until it is
    /// destroyed, even when the download session is evicted in the meantime. It can be
    /// consumed once.
    class ChunkStream
    {
    public:
        ChunkStream(std::shared_ptr<const OpenFile> file, format::ReadRange range);

        ChunkStream(ChunkStream &&) noexcept = default;
        ChunkStream &operator=(ChunkStream &&) noexcept = default;
        ChunkStream(const ChunkStream &) = delete;
        ChunkStream &operator=(const ChunkStream &) = delete;

        std::uint64_t offset() const noexcept { return range_.offset; }
        std::uint64_t length() const noexcept { return range_.length; }
        std::uint64_t remaining() const noexcept { return range_.length - consumed_; }
        bool done() const noexcept { return consumed_ == range_.length; }

        // Fills at most buffer.size() bytes; returns 0 once the stream is done.
        std::size_t read_some(std::span<std::byte> buffer);

        std::vector<std::byte> read_all();

    private:
        std::shared_ptr<const OpenFile> file_;
        format::ReadRange range_;
        std::uint64_t consumed_{0};
    };

} // namespace treasury::server

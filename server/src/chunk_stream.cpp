#include "treasury/server/chunk_stream.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "treasury/server/transfer_error.hpp"

namespace treasury::server
{

    std::shared_ptr<const OpenFile> OpenFile::open(const std::filesystem::path &path)
    {
        const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0)
        {
            if (errno == ENOENT || errno == ENOTDIR)
            {
                throw TransferError(ErrorCode::FileNotFound, "File not found");
            }
            throw TransferError(ErrorCode::IoError, "Failed to open " + path.string() + ": " + std::strerror(errno));
        }

        struct stat info{};
        if (::fstat(fd, &info) != 0 || !S_ISREG(info.st_mode))
        {
            ::close(fd);
            throw TransferError(ErrorCode::IoError, "Not a readable container: " + path.string());
        }

        try
        {
            return std::make_shared<const OpenFile>(Passkey{}, fd, static_cast<std::uint64_t>(info.st_size), path);
        }
        catch (const std::exception &)
        {
            ::close(fd);
            throw;
        }
    }

    OpenFile::OpenFile(Passkey, int fd, std::uint64_t size, std::filesystem::path path) noexcept
        : fd_(fd), size_(size), path_(std::move(path))
    {
    }

    OpenFile::~OpenFile()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
        }
    }

    std::size_t OpenFile::read_at(std::uint64_t offset, std::span<std::byte> buffer) const
    {
        for (;;)
        {
            const auto read = ::pread(fd_, buffer.data(), buffer.size(), static_cast<off_t>(offset));
            if (read >= 0)
            {
                return static_cast<std::size_t>(read);
            }
            if (errno != EINTR)
            {
                throw TransferError(ErrorCode::IoError, "Read from " + path_.string() + " failed: " + std::strerror(errno));
            }
        }
    }

    ChunkStream::ChunkStream(std::shared_ptr<const OpenFile> file, format::ReadRange range)
        : file_(std::move(file)), range_(range)
    {
    }

    std::size_t ChunkStream::read_some(std::span<std::byte> buffer)
    {
        if (done() || buffer.empty())
        {
            return 0;
        }
        const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), remaining()));
        const auto read = file_->read_at(range_.offset + consumed_, buffer.first(wanted));
        if (read == 0)
        {
            throw TransferError(ErrorCode::IoError, "Container ended before the requested chunk");
        }
        consumed_ += read;
        return read;
    }

    std::vector<std::byte> ChunkStream::read_all()
    {
        std::vector<std::byte> data(static_cast<std::size_t>(remaining()));
        std::size_t filled = 0;
        while (filled < data.size())
        {
            filled += read_some(std::span<std::byte>(data).subspan(filled));
        }
        return data;
    }

} // namespace treasury::server

#include "treasury/chunk_format.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace treasury::format
{

    std::uint64_t chunk_count(std::uint64_t raw_file_size) noexcept
    {
        const auto quotient = raw_file_size / kChunkDataSize;
        return raw_file_size % kChunkDataSize == 0 ? quotient : quotient + 1;
    }

    std::uint64_t encrypted_container_size(std::uint64_t raw_file_size) noexcept
    {
        return kContainerHeaderSize + chunk_count(raw_file_size) * kChunkOverhead + raw_file_size;
    }

    std::uint64_t raw_chunk_size(std::uint64_t encrypted_chunk_size)
    {
        if (encrypted_chunk_size < kChunkOverhead)
        {
            throw std::logic_error("Encrypted chunk of " + std::to_string(encrypted_chunk_size) +
                                   " bytes is smaller than the chunk overhead");
        }
        return encrypted_chunk_size - kChunkOverhead;
    }

    std::uint64_t raw_file_size_from_container_size(std::uint64_t container_size) noexcept
    {
        if (container_size <= kContainerHeaderSize)
        {
            return 0;
        }
        const auto body = container_size - kContainerHeaderSize;
        const auto chunks = (body + kEncryptedChunkSize - 1) / kEncryptedChunkSize;
        const auto overhead = chunks * kChunkOverhead;
        return body > overhead ? body - overhead : 0;
    }

    std::optional<std::uint64_t> expected_encrypted_chunk_size(std::uint64_t raw_file_size,
                                                               std::uint64_t chunk_id) noexcept
    {
        if (chunk_id >= chunk_count(raw_file_size))
        {
            return std::nullopt;
        }
        const auto bytes_before = chunk_id * kChunkDataSize;
        return std::min(kChunkDataSize, raw_file_size - bytes_before) + kChunkOverhead;
    }

    std::optional<ReadRange> chunk_read_range(std::uint64_t chunk_id, std::uint64_t container_size) noexcept
    {
        if (chunk_id > (std::numeric_limits<std::uint64_t>::max() - kContainerHeaderSize) / kEncryptedChunkSize)
        {
            return std::nullopt;
        }
        const auto offset = chunk_id * kEncryptedChunkSize + kContainerHeaderSize;
        if (offset > container_size)
        {
            return std::nullopt;
        }
        return ReadRange{
            .offset = offset,
            .length = std::min(kEncryptedChunkSize, container_size - offset),
        };
    }

    bool is_valid_handle(std::string_view handle) noexcept
    {
        if (handle.size() != kHandleLength)
        {
            return false;
        }
        return std::all_of(handle.begin(), handle.end(), [](char ch)
                           { return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9'); });
    }

} // namespace treasury::format

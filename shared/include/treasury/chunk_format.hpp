/**
 * Treasury - Encrypted container layout and chunk size arithmetic.
 *
 * A container is a 4 byte magic header followed by chunks laid out as
 * [chunk id (4B) | nonce (24B) | ciphertext | poly1305 tag (16B)].
 * Every chunk carries kChunkDataSize bytes of plaintext except the last one.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace treasury::format
{

    inline constexpr std::array<std::uint8_t, 4> kContainerMagic{0x2E, 0x54, 0x45, 0x46};
    inline constexpr std::uint64_t kContainerHeaderSize = kContainerMagic.size();

    inline constexpr std::uint64_t kChunkIdSize = 4;
    inline constexpr std::uint64_t kNonceSize = 24;
    inline constexpr std::uint64_t kAuthTagSize = 16;
    inline constexpr std::uint64_t kChunkOverhead = kChunkIdSize + kNonceSize + kAuthTagSize;

    inline constexpr std::uint64_t kChunkDataSize = 2 * 1024 * 1024;
    inline constexpr std::uint64_t kEncryptedChunkSize = kChunkDataSize + kChunkOverhead;

    inline constexpr std::uint64_t kMaxFileSize = 1ULL * 1024 * 1024 * 1024 * 1024;

    inline constexpr std::size_t kHandleLength = 16;
    inline constexpr std::string_view kContainerExtension = ".tef";

    struct ReadRange
    {
        std::uint64_t offset{};
        std::uint64_t length{};
    };

    // An empty file has no chunks; its container is only the header.
    std::uint64_t chunk_count(std::uint64_t raw_file_size) noexcept;

    std::uint64_t encrypted_container_size(std::uint64_t raw_file_size) noexcept;

    // Throws std::logic_error when encrypted_chunk_size < kChunkOverhead.
    std::uint64_t raw_chunk_size(std::uint64_t encrypted_chunk_size);

    std::uint64_t raw_file_size_from_container_size(std::uint64_t container_size) noexcept;

    /// Encrypted length the chunk at `chunk_id` must have for a file of `raw_file_size`
    /// bytes, or nullopt when the file has no such chunk.
    std::optional<std::uint64_t> expected_encrypted_chunk_size(std::uint64_t raw_file_size,
                                                               std::uint64_t chunk_id) noexcept;

    /// Byte range of `chunk_id` inside a stored container, or nullopt when the chunk
    /// starts past the end of the container.
    std::optional<ReadRange> chunk_read_range(std::uint64_t chunk_id, std::uint64_t container_size) noexcept;

    bool is_valid_handle(std::string_view handle) noexcept;

} // namespace treasury::format

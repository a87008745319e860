/**
 * Treasury - Length-prefixed JSON framing helpers.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

namespace treasury::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    // One base64 encoded encrypted chunk plus the envelope fits comfortably.
    inline constexpr std::size_t kDefaultMaxFrameSize = 4 * 1024 * 1024;

    class FrameTooLarge : public std::length_error
    {
    public:
        FrameTooLarge(std::size_t size, std::size_t limit);

        std::size_t size() const noexcept { return size_; }

    private:
        std::size_t size_;
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    std::uint32_t read_frame_header(const std::array<std::uint8_t, kFrameHeaderSize> &header) noexcept;

} // namespace treasury::protocol

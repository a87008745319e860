#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace treasury::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // Padded standard alphabet only. nullopt on foreign characters, a truncated final
    // quad or non-zero trailing bits. Whitespace is skipped.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace treasury::encoding

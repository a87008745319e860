#include "treasury/encoding/base64.hpp"

#include <array>
#include <cctype>
#include <cstdint>

namespace treasury::encoding
{

    namespace
    {

        constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        constexpr std::int8_t kInvalid = -1;
        constexpr std::int8_t kPadding = -2;

        consteval auto make_decode_table()
        {
            std::array<std::int8_t, 256> table{};
            table.fill(kInvalid);
            for (std::size_t i = 0; i < kAlphabet.size(); ++i)
            {
                table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
            }
            table[static_cast<unsigned char>('=')] = kPadding;
            return table;
        }

        constexpr auto kDecodeTable = make_decode_table();

    } // namespace

    std::string encode_base64(std::span<const std::byte> data)
    {
        std::string output;
        output.reserve(((data.size() + 2) / 3) * 4);

        std::size_t i = 0;
        for (; i + 3 <= data.size(); i += 3)
        {
            const auto group = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                               (std::to_integer<std::uint32_t>(data[i + 1]) << 8) |
                               std::to_integer<std::uint32_t>(data[i + 2]);
            output.push_back(kAlphabet[(group >> 18) & 0x3F]);
            output.push_back(kAlphabet[(group >> 12) & 0x3F]);
            output.push_back(kAlphabet[(group >> 6) & 0x3F]);
            output.push_back(kAlphabet[group & 0x3F]);
        }

        const auto tail = data.size() - i;
        if (tail == 1)
        {
            const auto group = std::to_integer<std::uint32_t>(data[i]) << 16;
            output.push_back(kAlphabet[(group >> 18) & 0x3F]);
            output.push_back(kAlphabet[(group >> 12) & 0x3F]);
            output.append("==");
        }
        else if (tail == 2)
        {
            const auto group = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                               (std::to_integer<std::uint32_t>(data[i + 1]) << 8);
            output.push_back(kAlphabet[(group >> 18) & 0x3F]);
            output.push_back(kAlphabet[(group >> 12) & 0x3F]);
            output.push_back(kAlphabet[(group >> 6) & 0x3F]);
            output.push_back('=');
        }

        return output;
    }

    std::optional<std::vector<std::byte>> decode_base64(std::string_view input)
    {
        std::vector<std::byte> output;
        output.reserve((input.size() / 4) * 3);

        std::uint32_t accumulator = 0;
        int bits_collected = 0;
        std::size_t symbols = 0;
        std::size_t padding = 0;
        for (const char ch : input)
        {
            const auto c = static_cast<unsigned char>(ch);
            const auto value = kDecodeTable[c];
            if (value == kInvalid)
            {
                if (!std::isspace(c))
                {
                    return std::nullopt;
                }
                continue;
            }
            if (value == kPadding)
            {
                ++padding;
                continue;
            }
            if (padding > 0)
            {
                return std::nullopt;
            }
            ++symbols;
            accumulator = ((accumulator << 6) | static_cast<std::uint32_t>(value)) & 0xFFFFFFu;
            bits_collected += 6;
            if (bits_collected >= 8)
            {
                bits_collected -= 8;
                output.push_back(static_cast<std::byte>((accumulator >> bits_collected) & 0xFFu));
            }
        }

        // Whole quads only, at most two '=' and no stray bits in the last symbol.
        if (symbols % 4 == 1 || padding > 2 || (symbols + padding) % 4 != 0)
        {
            return std::nullopt;
        }
        if ((accumulator & ((1u << bits_collected) - 1u)) != 0)
        {
            return std::nullopt;
        }
        return output;
    }

} // namespace treasury::encoding

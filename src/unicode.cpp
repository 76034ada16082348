#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "unicode.hpp"

std::size_t utf8_sequence_length(unsigned char lead)
{
    if (0 == (lead & 0x80)) return 1;       // 0xxxxxxx
    if (0xC0 == (lead & 0xE0)) return 2;    // 110xxxxx
    if (0xE0 == (lead & 0xF0)) return 3;    // 1110xxxx
    if (0xF0 == (lead & 0xF8)) return 4;    // 11110xxx
    return 0;
}

std::string encode_utf8(char32_t codepoint)
{
    if (codepoint > 0x10FFFF) {
        throw std::invalid_argument(
            fmt::format("Invalid Unicode codepoint: U+{:X} (must be <= U+10FFFF)",
                static_cast<std::uint32_t>(codepoint)));
    }
    if (codepoint >= 0xD800 and codepoint <= 0xDFFF) {
        throw std::invalid_argument(
            fmt::format("Invalid Unicode codepoint: U+{:X} (surrogate range not allowed)",
                static_cast<std::uint32_t>(codepoint)));
    }

    std::string result;
    if (codepoint <= 0x7F) {
        result.push_back(static_cast<char>(codepoint));
    } else if (codepoint <= 0x7FF) {
        result.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        result.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint <= 0xFFFF) {
        result.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        result.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        result.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        result.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
    return result;
}

char32_t decode_utf8(std::string_view text, std::size_t& index)
{
    if (index >= text.size()) {
        throw std::invalid_argument("Truncated UTF-8 sequence");
    }

    auto lead = static_cast<unsigned char>(text[index]);
    std::size_t length = utf8_sequence_length(lead);
    if (0 == length) {
        throw std::invalid_argument(
            fmt::format("Invalid UTF-8 start byte: 0x{:02X}", lead));
    }
    if (index + length > text.size()) {
        throw std::invalid_argument("Truncated UTF-8 sequence");
    }

    static constexpr unsigned char lead_masks[] = {0, 0x7F, 0x1F, 0x0F, 0x07};
    char32_t codepoint = lead & lead_masks[length];
    for (std::size_t i = 1; i < length; ++i) {
        auto byte = static_cast<unsigned char>(text[index + i]);
        if (0x80 != (byte & 0xC0)) {
            throw std::invalid_argument(
                fmt::format("Invalid UTF-8 continuation byte: 0x{:02X}", byte));
        }
        codepoint = (codepoint << 6) | (byte & 0x3F);
    }

    // Shortest encodings only
    static constexpr char32_t minimums[] = {0, 0, 0x80, 0x800, 0x10000};
    if (codepoint < minimums[length]) {
        throw std::invalid_argument("Overlong UTF-8 encoding");
    }
    if (codepoint >= 0xD800 and codepoint <= 0xDFFF) {
        throw std::invalid_argument(
            fmt::format("UTF-8 encoded surrogate: U+{:X}",
                static_cast<std::uint32_t>(codepoint)));
    }
    if (codepoint > 0x10FFFF) {
        throw std::invalid_argument(
            fmt::format("Codepoint outside Unicode range: U+{:X}",
                static_cast<std::uint32_t>(codepoint)));
    }

    index += length;
    return codepoint;
}

std::string utf32_to_utf8(std::u32string_view utf32)
{
    std::string result;
    result.reserve(utf32.size() * 2);
    for (char32_t codepoint : utf32) {
        result += encode_utf8(codepoint);
    }
    return result;
}

std::u32string utf8_to_utf32(std::string_view utf8)
{
    std::u32string result;
    result.reserve(utf8.size());
    for (std::size_t i = 0; i < utf8.size(); ) {
        result.push_back(decode_utf8(utf8, i));
    }
    return result;
}

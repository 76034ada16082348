#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// Strings are held as UTF-8 in std::string; characters are code points.

// Number of bytes in the UTF-8 sequence introduced by lead, or 0 if lead
// cannot start a sequence.
std::size_t utf8_sequence_length(unsigned char lead);

// Throws std::invalid_argument if codepoint isn't a valid Unicode scalar value.
std::string encode_utf8(char32_t codepoint);

// Decodes the code point starting at text[index] and advances index past it.
// Throws std::invalid_argument on malformed input.
char32_t decode_utf8(std::string_view text, std::size_t& index);

std::string utf32_to_utf8(std::u32string_view utf32);
std::u32string utf8_to_utf32(std::string_view utf8);

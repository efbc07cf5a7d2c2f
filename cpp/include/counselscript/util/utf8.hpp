#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace counselscript::util {

struct Codepoint {
    uint32_t value;
    size_t offset;   // byte offset in the source
    size_t size;     // encoded byte length
};

// Decode UTF-8 bytes; invalid sequences become U+FFFD covering one byte
std::vector<Codepoint> decode_utf8(std::string_view data);

// Number of codepoints (what a reader would call the character length)
size_t codepoint_length(std::string_view data);

// First n codepoints, never cutting a multi-byte sequence
std::string utf8_prefix(std::string_view data, size_t n);

std::string encode_utf8(uint32_t codepoint);

// ASCII-only lowercase; multi-byte sequences are left untouched
std::string to_lower_ascii(std::string_view data);

std::string trim(std::string_view data);

std::vector<std::string> split_whitespace(std::string_view data);

bool is_hiragana(uint32_t cp);
bool is_katakana(uint32_t cp);
bool is_kanji(uint32_t cp);
bool is_cjk(uint32_t cp);

} // namespace counselscript::util

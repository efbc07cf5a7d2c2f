#include "counselscript/util/utf8.hpp"

#include <cctype>

namespace counselscript::util {

// Hot path decoder: no logging, invalid bytes replaced with U+FFFD
std::vector<Codepoint> decode_utf8(std::string_view data) {
    std::vector<Codepoint> codepoints;
    codepoints.reserve(data.size());

    const auto* begin = reinterpret_cast<const uint8_t*>(data.data());
    const uint8_t* p = begin;
    const uint8_t* end = begin + data.size();

    auto continuation = [](uint8_t b) { return (b & 0xC0) == 0x80; };

    while (p < end) {
        const size_t offset = static_cast<size_t>(p - begin);
        const size_t remaining = static_cast<size_t>(end - p);
        uint32_t cp = 0xFFFD;
        size_t size = 1;

        if (*p < 0x80) {
            // ASCII fast path
            cp = *p;
        } else if ((*p & 0xE0) == 0xC0 && remaining >= 2 && continuation(p[1])) {
            cp = ((p[0] & 0x1F) << 6) | (p[1] & 0x3F);
            size = 2;
            if (cp < 0x80) cp = 0xFFFD; // Overlong
        } else if ((*p & 0xF0) == 0xE0 && remaining >= 3 &&
                   continuation(p[1]) && continuation(p[2])) {
            cp = ((p[0] & 0x0F) << 12) | ((p[1] & 0x3F) << 6) | (p[2] & 0x3F);
            size = 3;
            if (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF)) cp = 0xFFFD;
        } else if ((*p & 0xF8) == 0xF0 && remaining >= 4 &&
                   continuation(p[1]) && continuation(p[2]) && continuation(p[3])) {
            cp = ((p[0] & 0x07) << 18) | ((p[1] & 0x3F) << 12) | ((p[2] & 0x3F) << 6) | (p[3] & 0x3F);
            size = 4;
            if (cp < 0x10000 || cp > 0x10FFFF) cp = 0xFFFD;
        }

        codepoints.push_back({cp, offset, size});
        p += size;
    }

    return codepoints;
}

size_t codepoint_length(std::string_view data) {
    size_t count = 0;
    for (unsigned char c : data) {
        // Count every byte that is not a continuation byte
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

std::string utf8_prefix(std::string_view data, size_t n) {
    auto cps = decode_utf8(data);
    if (cps.size() <= n) return std::string(data);
    return std::string(data.substr(0, cps[n].offset));
}

std::string encode_utf8(uint32_t cp) {
    std::string result;
    if (cp < 0x80) {
        result.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        result.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        result.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        result.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return result;
}

std::string to_lower_ascii(std::string_view data) {
    std::string out(data);
    for (char& c : out) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x80) c = static_cast<char>(std::tolower(u));
    }
    return out;
}

std::string trim(std::string_view data) {
    const char* ws = " \t\r\n\f\v";
    auto first = data.find_first_not_of(ws);
    if (first == std::string_view::npos) return "";
    auto last = data.find_last_not_of(ws);
    return std::string(data.substr(first, last - first + 1));
}

std::vector<std::string> split_whitespace(std::string_view data) {
    std::vector<std::string> words;
    size_t i = 0;
    while (i < data.size()) {
        while (i < data.size() && std::isspace(static_cast<unsigned char>(data[i]))) ++i;
        size_t start = i;
        while (i < data.size() && !std::isspace(static_cast<unsigned char>(data[i]))) ++i;
        if (i > start) words.emplace_back(data.substr(start, i - start));
    }
    return words;
}

bool is_hiragana(uint32_t cp) { return cp >= 0x3041 && cp <= 0x3093; }

bool is_katakana(uint32_t cp) { return (cp >= 0x30A1 && cp <= 0x30F6) || cp == 0x30FC; }

bool is_kanji(uint32_t cp) { return cp >= 0x4E00 && cp <= 0x9FA0; }

bool is_cjk(uint32_t cp) {
    return (cp >= 0x3000 && cp <= 0x30FF) ||   // punctuation, kana
           (cp >= 0x3400 && cp <= 0x9FFF) ||   // ideographs
           (cp >= 0xF900 && cp <= 0xFAFF) ||
           (cp >= 0xFF00 && cp <= 0xFFEF) ||   // full-width forms
           (cp >= 0xAC00 && cp <= 0xD7AF);     // hangul
}

} // namespace counselscript::util

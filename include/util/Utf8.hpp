#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace safere::util {

// Bytes that are not part of a valid UTF-8 sequence decode to a pseudo code
// point above U+10FFFF so they can only be matched by `.` and negated classes.
inline constexpr uint32_t kMaxCodepoint  = 0x10FFFF;
inline constexpr uint32_t kInvalidBase   = 0x110000;
inline constexpr uint32_t kMaxPseudoCp   = kInvalidBase + 0xFF;

struct Decoded {
    uint32_t cp;
    int      len;   // bytes consumed, >= 1 unless at end of input
};

// Decode one code point at s[pos]. Never fails on input text: an invalid
// lead or truncated sequence yields a one-byte pseudo code point.
inline Decoded decode_at(std::string_view s, size_t pos) {
    if (pos >= s.size()) return {0, 0};
    auto c = (uint8_t)s[pos];
    size_t left = s.size() - pos;
    if (c < 0x80) return {c, 1};
    auto cont = [&](size_t i) { return ((uint8_t)s[pos + i] & 0xC0) == 0x80; };
    if ((c & 0xE0) == 0xC0 && left >= 2 && cont(1)) {
        uint32_t cp = ((uint32_t)(c & 0x1F) << 6) | ((uint8_t)s[pos + 1] & 0x3F);
        if (cp >= 0x80) return {cp, 2};
    } else if ((c & 0xF0) == 0xE0 && left >= 3 && cont(1) && cont(2)) {
        uint32_t cp = ((uint32_t)(c & 0x0F) << 12) | ((uint32_t)((uint8_t)s[pos + 1] & 0x3F) << 6)
                    | ((uint8_t)s[pos + 2] & 0x3F);
        if (cp >= 0x800 && (cp < 0xD800 || cp > 0xDFFF)) return {cp, 3};
    } else if ((c & 0xF8) == 0xF0 && left >= 4 && cont(1) && cont(2) && cont(3)) {
        uint32_t cp = ((uint32_t)(c & 0x07) << 18) | ((uint32_t)((uint8_t)s[pos + 1] & 0x3F) << 12)
                    | ((uint32_t)((uint8_t)s[pos + 2] & 0x3F) << 6) | ((uint8_t)s[pos + 3] & 0x3F);
        if (cp >= 0x10000 && cp <= kMaxCodepoint) return {cp, 4};
    }
    return {kInvalidBase + c, 1};
}

// Strict decode for pattern text. Returns bytes consumed, 0 on malformed input.
inline int decode_strict(std::string_view s, size_t pos, uint32_t* cp) {
    auto d = decode_at(s, pos);
    if (d.len == 0 || d.cp >= kInvalidBase) return 0;
    *cp = d.cp;
    return d.len;
}

// Length of the code point that ends at s[pos - 1]. Returns 0 at pos == 0.
inline int prev_len(std::string_view s, size_t pos) {
    if (pos == 0) return 0;
    size_t start = pos - 1;
    int back = 1;
    while (back < 4 && start > 0 && ((uint8_t)s[start] & 0xC0) == 0x80) { --start; ++back; }
    if (decode_at(s, start).len == back) return back;
    return 1;
}

inline void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back((char)cp);
    } else if (cp < 0x800) {
        out.push_back((char)(0xC0 | (cp >> 6)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back((char)(0xE0 | (cp >> 12)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp <= kMaxCodepoint) {
        out.push_back((char)(0xF0 | (cp >> 18)));
        out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        out.push_back((char)(cp - kInvalidBase));
    }
}

} // namespace safere::util

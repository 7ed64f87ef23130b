#pragma once

#include <array>
#include <cstdint>

namespace safere::util {

namespace detail {
constexpr std::array<unsigned char, 256> make_lower_table() {
    std::array<unsigned char, 256> t{};
    for (int i = 0; i < 256; ++i)
        t[i] = (i >= 'A' && i <= 'Z') ? (unsigned char)(i + 32) : (unsigned char)i;
    return t;
}
inline constexpr auto kLowerTable = make_lower_table();
} // namespace detail

[[nodiscard]] constexpr unsigned char ascii_lower(unsigned char c) { return detail::kLowerTable[c]; }

[[nodiscard]] constexpr bool is_word_byte(uint32_t c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

// Simple case folding: ASCII and Latin-1 letters. Maps to lower case.
[[nodiscard]] constexpr uint32_t simple_fold(uint32_t cp) {
    if (cp >= 'A' && cp <= 'Z') return cp + 32;
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 32;
    return cp;
}

// The other case of a foldable letter, or cp itself.
[[nodiscard]] constexpr uint32_t other_case(uint32_t cp) {
    if (cp >= 'A' && cp <= 'Z') return cp + 32;
    if (cp >= 'a' && cp <= 'z') return cp - 32;
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 32;
    if (cp >= 0xE0 && cp <= 0xFE && cp != 0xF7) return cp - 32;
    return cp;
}

} // namespace safere::util

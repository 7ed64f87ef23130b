#include "util/BoyerMoore.hpp"

namespace safere::util {

BoyerMooreSearch::BoyerMooreSearch(std::string pattern, bool fold_ascii)
    : pattern_(std::move(pattern)), fold_(fold_ascii) {
    if (pattern_.empty()) return; // empty pattern matches everywhere
    compute_bad_char();
}

void BoyerMooreSearch::compute_bad_char() {
    const size_t m = pattern_.size();
    // All characters default to maximum shift (pattern length)
    for (int i = 0; i < ALPHABET_SIZE; ++i) bad_char_[i] = m;
    // Characters in pattern (except last) get actual shift distances
    for (size_t i = 0; i + 1 < m; ++i) bad_char_[key(pattern_[i])] = m - 1 - i;
}

size_t BoyerMooreSearch::search(std::string_view text, size_t from) const {
    const size_t n = text.size();
    const size_t m = pattern_.size();

    if (from > n) return npos;
    if (m == 0) return from;
    if (m > n - from) return npos;

    size_t i = from;
    while (i <= n - m) {
        size_t j = m;
        // Compare right to left
        while (j > 0 && key(text[i + j - 1]) == key(pattern_[j - 1])) --j;
        if (j == 0) return i;

        // Bad character shift
        size_t shift = bad_char_[key(text[i + m - 1])];
        i += (shift > 0) ? shift : 1;
    }
    return npos;
}

} // namespace safere::util

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include "util/AsciiLower.hpp"

namespace safere::util {

// Boyer-Moore-Horspool literal search.
// O(1) extra space (fixed 256-entry bad character table).
// Average case: O(n/m) sublinear. Worst case: O(n*m).
// Optional ASCII case-insensitivity via ascii_lower.
class BoyerMooreSearch {
public:
    static constexpr size_t npos = std::string_view::npos;

    BoyerMooreSearch() = default;
    explicit BoyerMooreSearch(std::string pattern, bool fold_ascii = false);

    // Position of the first match at or after `from`, or npos.
    [[nodiscard]] size_t search(std::string_view text, size_t from = 0) const;

    [[nodiscard]] bool empty() const { return pattern_.empty(); }
    [[nodiscard]] const std::string& pattern() const { return pattern_; }

private:
    static constexpr int ALPHABET_SIZE = 256;

    size_t bad_char_[ALPHABET_SIZE]{};
    std::string pattern_;
    bool fold_{false};

    [[nodiscard]] unsigned char key(char c) const {
        auto u = static_cast<unsigned char>(c);
        return fold_ ? ascii_lower(u) : u;
    }
    void compute_bad_char();
};

} // namespace safere::util

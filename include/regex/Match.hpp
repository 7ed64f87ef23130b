#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace safere::regex {

struct Span {
    size_t start{0};
    size_t end{0};  // exclusive

    [[nodiscard]] size_t size() const { return end - start; }
    [[nodiscard]] bool empty() const { return end == start; }
    bool operator==(const Span&) const = default;
};

// One match: the whole span plus one optional span per capture group,
// groups[0] being group 1. A group that did not participate is nullopt.
struct MatchResult {
    Span full;
    std::vector<std::optional<Span>> groups;

    // idx 0 is the whole match; out-of-range idx is treated as absent.
    [[nodiscard]] std::optional<Span> group(long idx) const {
        if (idx == 0) return full;
        if (idx < 0 || (size_t)idx > groups.size()) return std::nullopt;
        return groups[(size_t)idx - 1];
    }

    [[nodiscard]] std::string_view text(std::string_view input, long idx = 0) const {
        auto g = group(idx);
        if (!g) return {};
        return input.substr(g->start, g->size());
    }

    bool operator==(const MatchResult&) const = default;
};

enum class MatchMode {
    FindFirst,       // leftmost match anywhere
    FindAll,         // non-overlapping matches, left to right
    AnchoredPrefix,  // match must start at offset 0
    AnchoredSuffix,  // match must end at the end of input
};

[[nodiscard]] const char* match_mode_name(MatchMode m);

} // namespace safere::regex

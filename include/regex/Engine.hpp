#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "regex/Match.hpp"

namespace safere::regex {

enum class EngineKind { Automaton, Fallback };

[[nodiscard]] const char* engine_kind_name(EngineKind k);

// A compiled pattern. Immutable after construction and safe to share
// between threads; every call allocates its own scratch state.
class CompiledEngine {
public:
    virtual ~CompiledEngine() = default;
    CompiledEngine(const CompiledEngine&) = delete;
    CompiledEngine& operator=(const CompiledEngine&) = delete;

    [[nodiscard]] std::optional<MatchResult> match(std::string_view input) const;
    [[nodiscard]] std::vector<MatchResult> match_all(std::string_view input) const;

    // FindFirst / AnchoredPrefix / AnchoredSuffix yield zero or one result,
    // FindAll yields every non-overlapping match.
    [[nodiscard]] std::vector<MatchResult> run(std::string_view input, MatchMode mode) const;

    [[nodiscard]] virtual EngineKind kind() const = 0;
    [[nodiscard]] const std::string& pattern() const { return pattern_; }
    [[nodiscard]] int group_count() const { return group_count_; }
    [[nodiscard]] const std::vector<std::pair<std::string, int>>& group_names() const { return names_; }
    // Group index for a name, or -1.
    [[nodiscard]] int group_index(std::string_view name) const;

    // Human-readable description of the compiled form.
    [[nodiscard]] virtual std::string explain() const = 0;

protected:
    CompiledEngine(std::string pattern, int group_count, std::vector<std::pair<std::string, int>> names)
        : pattern_(std::move(pattern)), group_count_(group_count), names_(std::move(names)) {}

    // Leftmost-first search starting at `from`. Assertions see the whole
    // input. anchor_start: the match must begin at `from`; anchor_end: it
    // must end at input.size().
    [[nodiscard]] virtual std::optional<MatchResult> search(std::string_view input, size_t from,
                                                            bool anchor_start, bool anchor_end) const = 0;

    // Convert a slot vector (2 per group, -1 unset) to a MatchResult.
    [[nodiscard]] static MatchResult to_result(const std::vector<long>& slots, int group_count);

private:
    std::string pattern_;
    int group_count_;
    std::vector<std::pair<std::string, int>> names_;
};

using EngineHandle = std::shared_ptr<const CompiledEngine>;

} // namespace safere::regex

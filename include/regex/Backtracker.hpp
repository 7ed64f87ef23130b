#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "regex/Engine.hpp"
#include "regex/Program.hpp"
#include "util/BoyerMoore.hpp"

namespace safere::regex {

// Backtracking matcher for patterns the automaton cannot express
// (backreferences, lookaround, atomic groups, possessive quantifiers).
// Runs the same instruction program depth first with an explicit choice
// stack. Every call is bounded by a step budget; exhausting it throws
// FallbackTimeout instead of running for exponential time.
class Backtracker final : public CompiledEngine {
public:
    Backtracker(std::string pattern, Program prog, std::vector<std::pair<std::string, int>> names,
                unsigned long long step_budget);

    [[nodiscard]] EngineKind kind() const override { return EngineKind::Fallback; }
    [[nodiscard]] std::string explain() const override;
    [[nodiscard]] const Program& program() const { return prog_; }
    [[nodiscard]] unsigned long long step_budget() const { return step_budget_; }

protected:
    [[nodiscard]] std::optional<MatchResult> search(std::string_view input, size_t from,
                                                    bool anchor_start, bool anchor_end) const override;

private:
    Program prog_;
    safere::util::BoyerMooreSearch prefix_;
    unsigned long long step_budget_;
};

} // namespace safere::regex

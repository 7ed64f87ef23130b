#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "regex/Engine.hpp"
#include "regex/Program.hpp"
#include "util/BoyerMoore.hpp"

namespace safere::regex {

// Thompson NFA regex engine (Pike VM).
// Code point simulator over byte offsets, UTF-8 aware.
// Threads are kept in priority order, so the first thread to reach MATCH is
// the leftmost-first match; captures ride along in per-thread slots.
// Counter values of one loop that sit next to each other in priority order
// share a bundle, which advances past a code point in O(1) whatever the bound.
class ThompsonNFA final : public CompiledEngine {
public:
    ThompsonNFA(std::string pattern, Program prog, std::vector<std::pair<std::string, int>> names);

    [[nodiscard]] EngineKind kind() const override { return EngineKind::Automaton; }
    [[nodiscard]] std::string explain() const override;
    [[nodiscard]] const Program& program() const { return prog_; }

    // Does the entire input match the pattern? (implicitly anchored ^...$)
    [[nodiscard]] bool full_match(std::string_view input) const;

protected:
    [[nodiscard]] std::optional<MatchResult> search(std::string_view input, size_t from,
                                                    bool anchor_start, bool anchor_end) const override;

private:
    // One live value of a loop counter: the step at which it was zero and the
    // capture slots of the thread that entered the loop.
    struct Member {
        long entry;
        std::vector<long> slots;
    };

    // Members of one counter loop, adjacent in priority order. Entries rise
    // or fall strictly along the deque.
    struct Bundle {
        int32_t counter;
        std::deque<Member> members;
    };

    // Entries at one input position, in priority order. A plain thread owns
    // a row of row_size capture slots; a bundle entry points into bundles.
    struct ThreadList {
        std::vector<int32_t>  pcs;
        std::vector<long>     rows;
        std::vector<int32_t>  bundle_of;  // index into bundles, -1 for a plain thread
        std::vector<Bundle>   bundles;
        std::vector<uint32_t> seen;       // seen[pc] == gen: pc already on this list
        std::vector<uint32_t> saturated;  // saturated[counter] == gen: unbounded loop already holds min
        uint32_t              gen{1};

        void reset(size_t nprog, size_t ncounters);
        void clear();
    };

    struct Job {
        int32_t pc;       // -1: restore job
        int32_t slot;
        long    value;
    };

    Program prog_;
    safere::util::BoyerMooreSearch prefix_;
    size_t row_size_;

    // Follow epsilon edges from pc at pos, appending consuming states and
    // MATCH to the list in priority order. row is scratch and is restored.
    void add_thread(ThreadList& list, int32_t pc, std::string_view input, size_t pos, long step,
                    long* row, std::vector<Job>& stack) const;

    // Move a bundle at pc past code point cp into list, which sits at pos.
    void step_bundle(int32_t pc, Bundle& bundle, ThreadList& list, std::string_view input, size_t pos,
                     long step, uint32_t cp, std::vector<Job>& stack) const;

    void push_members(ThreadList& list, int32_t pc, int32_t counter, std::deque<Member> members) const;

    // First state after JMP and ASSERT edges from pc, or -1 when an
    // assertion fails at pos.
    [[nodiscard]] int32_t follow_assertions(int32_t pc, std::string_view input, size_t pos) const;
};

} // namespace safere::regex

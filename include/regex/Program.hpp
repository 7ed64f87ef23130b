#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "regex/Ast.hpp"
#include "util/AsciiLower.hpp"

namespace safere::regex {

// Instruction program shared by both engines. SPLIT prefers `out` over
// `out1`; that order is the leftmost-first priority.
enum class Op : uint8_t {
    CHAR,     // arg = code point, fold
    CLASS,    // arg = index into classes
    ANY,      // any code point; newline only if flag
    SPLIT,    // out, out1
    JMP,      // out
    SAVE,     // arg = capture slot (2*group, 2*group+1)
    ASSERT,   // arg = AssertKind
    MARK,     // arg = progress register: reg = position
    CHECK,    // arg = progress register: fail if position == reg
    CINIT,    // arg = counter slot: counter = 0
    CLOOP,    // arg = counter slot, min, max, flag = greedy; out = body, out1 = exit
    CINC,     // arg = counter slot, reg = progress register; out = CLOOP
    MATCH,
    // Backtracking-only instructions.
    BACKREF,  // arg = group, fold
    LOOK,     // out = continuation, out1 = sub-program, flag = negated, behind
    ATOMIC,   // out = continuation, out1 = sub-program
    SUCCEED,  // end of a LOOK / ATOMIC sub-program
};

struct Inst {
    Op       op{Op::MATCH};
    bool     flag{false};     // CHAR: fold, ANY: dotall, CLOOP: greedy, LOOK: negated, BACKREF: fold
    bool     behind{false};   // LOOK
    uint32_t arg{0};
    int32_t  out{-1};
    int32_t  out1{-1};
    int32_t  min{0};          // CLOOP
    int32_t  max{-1};         // CLOOP, -1 = unbounded
    int32_t  reg{-1};         // CINC
};

struct Program {
    std::vector<Inst>      insts;
    std::vector<CharClass> classes;
    int start{0};
    int group_count{0};       // capture groups, excluding group 0
    int counter_count{0};
    int register_count{0};
    bool anchored_start{false};   // every match must begin at offset 0
    std::string literal_prefix;   // every match starts with these bytes
    bool prefix_fold{false};      // literal_prefix is ASCII and case-insensitive
    // Counter slot whose loop body contains each pc, or -1. Filled only for
    // automaton programs, where a counter loop body is one code point test
    // with optional assertions around it.
    std::vector<int32_t> live_counter;
    std::vector<int32_t> counter_loop;   // automaton: CLOOP pc of each counter

    [[nodiscard]] int slot_count() const { return 2 * (group_count + 1); }
    [[nodiscard]] std::string dump() const;
};

// Zero-width assertion at byte offset pos of the whole input.
[[nodiscard]] bool check_assert(AssertKind kind, std::string_view input, size_t pos);

struct CompileOptions {
    int max_repeat{65535};
    int replicate_limit{2000};     // unroll {m,n} while the copy stays below this
    int max_program_size{200000};
};

enum class ProgramTarget { Automaton, Backtrack };

// Lower a parsed pattern to a program. For ProgramTarget::Automaton the
// caller must have checked Regexp::unsupported first; compound counter loops
// or an oversized program are reported through `unsupported`.
// Returns false when `unsupported` was set.
[[nodiscard]] bool build_program(const Regexp& re, const CompileOptions& opts, ProgramTarget target,
                                 Program& out, UnsupportedConstruct& unsupported);

// CHAR / CLASS / ANY against one decoded code point.
[[nodiscard]] inline bool char_matches(const Program& prog, const Inst& in, uint32_t cp) {
    switch (in.op) {
        case Op::CHAR:
            return in.flag ? util::simple_fold(cp) == util::simple_fold(in.arg) : cp == in.arg;
        case Op::CLASS:
            return prog.classes[in.arg].matches(cp);
        case Op::ANY:
            return in.flag || cp != '\n';
        default:
            return false;
    }
}

} // namespace safere::regex

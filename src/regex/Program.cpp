#include "regex/Program.hpp"
#include "util/Utf8.hpp"
#include <algorithm>
#include <cstdio>

namespace safere::regex {

namespace {

// NFA fragment: a start state and a list of dangling output pointers.
// Outputs are stored as (state_index, which_out) pairs.
struct Frag {
    int start;
    struct Patch { int32_t state; bool is_out1; };
    std::vector<Patch> outs;
};

// Thrown inside the builder only; build_program turns it into an
// UnsupportedConstruct.
struct Overflow { const char* reason; size_t offset; };

bool nullable(const Node& n) {
    switch (n.kind) {
        case NodeKind::Empty:
        case NodeKind::Assert:
        case NodeKind::Look:
        case NodeKind::Backref:
            return true;
        case NodeKind::Literal:
        case NodeKind::AnyChar:
        case NodeKind::Class:
            return false;
        case NodeKind::Concat:
            return std::all_of(n.children.begin(), n.children.end(), [](auto& c) { return nullable(*c); });
        case NodeKind::Alternate:
            return std::any_of(n.children.begin(), n.children.end(), [](auto& c) { return nullable(*c); });
        case NodeKind::Repeat:
            return n.min == 0 || nullable(*n.children[0]);
        case NodeKind::Group:
        case NodeKind::Atomic:
            return nullable(*n.children[0]);
    }
    return true;
}

bool starts_anchored(const Node& n) {
    switch (n.kind) {
        case NodeKind::Assert:
            return n.assertion == AssertKind::BeginText;
        case NodeKind::Concat:
            return !n.children.empty() && starts_anchored(*n.children[0]);
        case NodeKind::Group:
        case NodeKind::Atomic:
            return starts_anchored(*n.children[0]);
        case NodeKind::Alternate:
            return std::all_of(n.children.begin(), n.children.end(), [](auto& c) { return starts_anchored(*c); });
        default:
            return false;
    }
}

// Appends the literal bytes every match must begin with. Returns false once
// the literal run ends.
bool collect_prefix(const Node& n, std::string& out, bool& fold) {
    switch (n.kind) {
        case NodeKind::Literal:
            if (n.fold) {
                if (n.cp >= 0x80) return false;
                fold = true;
            }
            safere::util::append_utf8(out, n.cp);
            return true;
        case NodeKind::Concat:
            for (auto& c : n.children)
                if (!collect_prefix(*c, out, fold)) return false;
            return true;
        case NodeKind::Group:
            return collect_prefix(*n.children[0], out, fold);
        default:
            return false;
    }
}

class Builder {
public:
    Builder(const CompileOptions& opts, ProgramTarget target, Program& prog)
        : opts_(opts), target_(target), prog_(prog) {}

    Frag compile(const Node& n) {
        switch (n.kind) {
            case NodeKind::Empty:
                return nop();
            case NodeKind::Literal: {
                int s = emit(Op::CHAR, n.offset);
                prog_.insts[s].arg = n.cp;
                prog_.insts[s].flag = n.fold;
                return {s, {{s, false}}};
            }
            case NodeKind::AnyChar: {
                int s = emit(Op::ANY, n.offset);
                prog_.insts[s].flag = n.dotall;
                return {s, {{s, false}}};
            }
            case NodeKind::Class: {
                int s = emit(Op::CLASS, n.offset);
                prog_.insts[s].arg = (uint32_t)prog_.classes.size();
                prog_.classes.push_back(n.cls);
                return {s, {{s, false}}};
            }
            case NodeKind::Assert: {
                int s = emit(Op::ASSERT, n.offset);
                prog_.insts[s].arg = (uint32_t)n.assertion;
                return {s, {{s, false}}};
            }
            case NodeKind::Concat: {
                Frag f = compile(*n.children[0]);
                for (size_t i = 1; i < n.children.size(); ++i) {
                    Frag g = compile(*n.children[i]);
                    patch(f.outs, g.start);
                    f.outs = std::move(g.outs);
                }
                return f;
            }
            case NodeKind::Alternate: {
                std::vector<Frag> branches;
                for (auto& c : n.children) branches.push_back(compile(*c));
                Frag result = std::move(branches.back());
                for (int i = (int)branches.size() - 2; i >= 0; --i) {
                    int sp = emit(Op::SPLIT, n.offset);
                    prog_.insts[sp].out = branches[i].start;
                    prog_.insts[sp].out1 = result.start;
                    auto outs = std::move(branches[i].outs);
                    outs.insert(outs.end(), result.outs.begin(), result.outs.end());
                    result = {sp, std::move(outs)};
                }
                return result;
            }
            case NodeKind::Group: {
                if (n.capture == 0) return compile(*n.children[0]);
                int open = emit(Op::SAVE, n.offset);
                prog_.insts[open].arg = (uint32_t)(2 * n.capture);
                Frag body = compile(*n.children[0]);
                int close = emit(Op::SAVE, n.offset);
                prog_.insts[close].arg = (uint32_t)(2 * n.capture + 1);
                prog_.insts[open].out = body.start;
                patch(body.outs, close);
                return {open, {{close, false}}};
            }
            case NodeKind::Repeat:
                if (n.possessive) return sub_program(Op::ATOMIC, n, [&] { return repeat(n); });
                return repeat(n);
            case NodeKind::Backref: {
                int s = emit(Op::BACKREF, n.offset);
                prog_.insts[s].arg = (uint32_t)n.capture;
                prog_.insts[s].flag = n.fold;
                return {s, {{s, false}}};
            }
            case NodeKind::Look: {
                Frag f = sub_program(Op::LOOK, n, [&] { return compile(*n.children[0]); });
                prog_.insts[f.start].flag = n.negated;
                prog_.insts[f.start].behind = n.behind;
                return f;
            }
            case NodeKind::Atomic:
                return sub_program(Op::ATOMIC, n, [&] { return compile(*n.children[0]); });
        }
        return nop();
    }

    void finish(const Frag& f) {
        int m = emit(Op::MATCH, 0);
        patch(f.outs, m);
        prog_.start = f.start;
        prog_.live_counter.resize(prog_.insts.size(), -1);
    }

private:
    const CompileOptions& opts_;
    ProgramTarget target_;
    Program& prog_;

    int emit(Op op, size_t offset) {
        if ((int)prog_.insts.size() >= opts_.max_program_size)
            throw Overflow{"program exceeds size budget", offset};
        Inst in;
        in.op = op;
        prog_.insts.push_back(in);
        return (int)prog_.insts.size() - 1;
    }

    Frag nop() {
        int s = emit(Op::JMP, 0);
        return {s, {{s, false}}};
    }

    // Patch all dangling outputs to point to a target state.
    void patch(const std::vector<Frag::Patch>& outs, int target) {
        for (auto& p : outs) {
            if (p.is_out1)
                prog_.insts[p.state].out1 = target;
            else
                prog_.insts[p.state].out = target;
        }
    }

    // SPLIT preferring `body` when greedy; the exit side stays dangling.
    int split(int body, bool greedy, Frag::Patch& exit, size_t offset) {
        int sp = emit(Op::SPLIT, offset);
        if (greedy) {
            prog_.insts[sp].out = body;
            exit = {sp, true};
        } else {
            prog_.insts[sp].out1 = body;
            exit = {sp, false};
        }
        return sp;
    }

    template <class Body>
    Frag sub_program(Op op, const Node& n, Body body) {
        int s = emit(op, n.offset);
        Frag f = body();
        int done = emit(Op::SUCCEED, n.offset);
        patch(f.outs, done);
        prog_.insts[s].out1 = f.start;
        return {s, {{s, false}}};
    }

    int new_register() { return prog_.register_count++; }

    // x?  x*  x+ over an already compiled body.
    Frag quest(Frag f, bool greedy, size_t off) {
        Frag::Patch exit{};
        int sp = split(f.start, greedy, exit, off);
        f.outs.push_back(exit);
        return {sp, std::move(f.outs)};
    }

    Frag star(Frag f, bool guard, bool greedy, size_t off) {
        Frag::Patch exit{};
        int loop = split(-1, greedy, exit, off);
        int entry = f.start;
        int back = loop;
        if (guard) {
            int r = new_register();
            int mark = emit(Op::MARK, off);
            prog_.insts[mark].arg = (uint32_t)r;
            prog_.insts[mark].out = f.start;
            int check = emit(Op::CHECK, off);
            prog_.insts[check].arg = (uint32_t)r;
            prog_.insts[check].out = loop;
            entry = mark;
            back = check;
        }
        if (greedy) prog_.insts[loop].out = entry; else prog_.insts[loop].out1 = entry;
        patch(f.outs, back);
        return {loop, {exit}};
    }

    Frag plus(Frag f, bool guard, bool greedy, size_t off) {
        int entry = f.start;
        int again = entry;
        if (guard) {
            int r = new_register();
            int mark = emit(Op::MARK, off);
            prog_.insts[mark].arg = (uint32_t)r;
            prog_.insts[mark].out = f.start;
            int check = emit(Op::CHECK, off);
            prog_.insts[check].arg = (uint32_t)r;
            prog_.insts[check].out = mark;
            entry = mark;
            again = check;
        }
        Frag::Patch exit{};
        int sp = split(again, greedy, exit, off);
        patch(f.outs, sp);
        return {entry, {exit}};
    }

    Frag repeat(const Node& n) {
        const Node& child = *n.children[0];
        const bool guard = nullable(child);
        const size_t off = n.offset;

        size_t before = prog_.insts.size();
        Frag first = compile(child);
        size_t body_size = prog_.insts.size() - before;

        if (n.min == 0 && n.max == 1) return quest(std::move(first), n.greedy, off);
        if (n.min == 0 && n.max == -1) return star(std::move(first), guard, n.greedy, off);
        if (n.min == 1 && n.max == -1) return plus(std::move(first), guard, n.greedy, off);
        if (n.min == 1 && n.max == 1) return first;
        if (n.max == 0) {
            // x{0}: the body can never run; keep it unreachable.
            return nop();
        }

        long copies = n.max == -1 ? (long)n.min + 1 : (long)n.max;
        long unrolled = (long)body_size * copies;
        bool replicate = unrolled <= opts_.replicate_limit;
        if (!replicate && target_ == ProgramTarget::Automaton && !single_step(first)) {
            // The automaton runs a counter only over a single code point test.
            if (unrolled > opts_.max_program_size) throw Overflow{"compound counted repetition", off};
            replicate = true;
        }
        if (replicate) return unroll(child, std::move(first), n, guard);
        return counted(std::move(first), before, n, guard);
    }

    // x{m,n} as m copies followed by x* or a chain of (n-m) optional copies.
    Frag unroll(const Node& child, Frag first, const Node& n, bool guard) {
        const size_t off = n.offset;
        if (n.min == 0) {
            // Optional chain x(x(x)?)? starting from the compiled copy.
            Frag::Patch exit{};
            int sp = split(first.start, n.greedy, exit, off);
            Frag result{sp, {exit}};
            std::vector<Frag::Patch> tail = std::move(first.outs);
            if (n.max == -1) {
                Frag rest = star(compile(child), guard, n.greedy, off);
                patch(tail, rest.start);
                result.outs.insert(result.outs.end(), rest.outs.begin(), rest.outs.end());
                return result;
            }
            for (int i = 1; i < n.max; ++i) {
                Frag next = compile(child);
                Frag::Patch e{};
                int s = split(next.start, n.greedy, e, off);
                patch(tail, s);
                result.outs.push_back(e);
                tail = std::move(next.outs);
            }
            result.outs.insert(result.outs.end(), tail.begin(), tail.end());
            return result;
        }

        Frag result = std::move(first);
        for (int i = 1; i < n.min; ++i) {
            Frag next = compile(child);
            patch(result.outs, next.start);
            result.outs = std::move(next.outs);
        }
        if (n.max == -1) {
            Frag rest = star(compile(child), guard, n.greedy, off);
            patch(result.outs, rest.start);
            result.outs = std::move(rest.outs);
            return result;
        }
        std::vector<Frag::Patch> exits;
        for (int i = n.min; i < n.max; ++i) {
            Frag next = compile(child);
            Frag::Patch e{};
            int s = split(next.start, n.greedy, e, off);
            patch(result.outs, s);
            exits.push_back(e);
            result.outs = std::move(next.outs);
        }
        result.outs.insert(result.outs.end(), exits.begin(), exits.end());
        return result;
    }

    // A straight run of assertions around exactly one code point test.
    bool single_step(const Frag& f) const {
        if (f.outs.size() != 1 || f.outs[0].is_out1) return false;
        int consuming = 0;
        int32_t pc = f.start;
        for (size_t n = 0; n < prog_.insts.size() && pc >= 0; ++n) {
            const Inst& in = prog_.insts[(size_t)pc];
            switch (in.op) {
                case Op::CHAR:
                case Op::CLASS:
                case Op::ANY:
                    ++consuming;
                    break;
                case Op::JMP:
                case Op::ASSERT:
                    break;
                default:
                    return false;
            }
            if (pc == f.outs[0].state) return consuming == 1;
            pc = in.out;
        }
        return false;
    }

    // x{m,n} with a counter: CINIT c; L: CLOOP c -> body -> CINC c -> L.
    Frag counted(Frag body, size_t body_begin, const Node& n, bool guard) {
        const size_t off = n.offset;
        size_t body_end = prog_.insts.size();
        int c = prog_.counter_count++;

        int init = emit(Op::CINIT, off);
        prog_.insts[init].arg = (uint32_t)c;
        int loop = emit(Op::CLOOP, off);
        Inst& l = prog_.insts[loop];
        l.arg = (uint32_t)c;
        l.min = n.min;
        l.max = n.max;
        l.flag = n.greedy;
        prog_.insts[init].out = loop;

        int entry = body.start;
        int reg = -1;
        std::vector<int> extra{loop};
        if (guard && n.max == -1) {
            reg = new_register();
            int mark = emit(Op::MARK, off);
            prog_.insts[mark].arg = (uint32_t)reg;
            prog_.insts[mark].out = body.start;
            entry = mark;
            extra.push_back(mark);
        }
        int inc = emit(Op::CINC, off);
        prog_.insts[inc].arg = (uint32_t)c;
        prog_.insts[inc].reg = reg;
        prog_.insts[inc].out = loop;
        extra.push_back(inc);
        prog_.insts[loop].out = entry;
        patch(body.outs, inc);

        if (target_ == ProgramTarget::Automaton) {
            prog_.counter_loop.push_back(loop);
            prog_.live_counter.resize(prog_.insts.size(), -1);
            for (size_t pc = body_begin; pc < body_end; ++pc) prog_.live_counter[pc] = c;
            for (int pc : extra) prog_.live_counter[(size_t)pc] = c;
        }
        return {init, {{loop, true}}};
    }
};

const char* op_name(Op op) {
    switch (op) {
        case Op::CHAR: return "char";
        case Op::CLASS: return "class";
        case Op::ANY: return "any";
        case Op::SPLIT: return "split";
        case Op::JMP: return "jmp";
        case Op::SAVE: return "save";
        case Op::ASSERT: return "assert";
        case Op::MARK: return "mark";
        case Op::CHECK: return "check";
        case Op::CINIT: return "cinit";
        case Op::CLOOP: return "cloop";
        case Op::CINC: return "cinc";
        case Op::MATCH: return "match";
        case Op::BACKREF: return "backref";
        case Op::LOOK: return "look";
        case Op::ATOMIC: return "atomic";
        case Op::SUCCEED: return "succeed";
    }
    return "?";
}

} // namespace

bool check_assert(AssertKind kind, std::string_view input, size_t pos) {
    switch (kind) {
        case AssertKind::BeginText: return pos == 0;
        case AssertKind::EndText:   return pos == input.size();
        case AssertKind::BeginLine: return pos == 0 || input[pos - 1] == '\n';
        case AssertKind::EndLine:   return pos == input.size() || input[pos] == '\n';
        case AssertKind::WordBoundary:
        case AssertKind::NotWordBoundary: {
            bool before = pos > 0 && util::is_word_byte((uint8_t)input[pos - 1]);
            bool after = pos < input.size() && util::is_word_byte((uint8_t)input[pos]);
            return (before != after) == (kind == AssertKind::WordBoundary);
        }
    }
    return false;
}

bool build_program(const Regexp& re, const CompileOptions& opts, ProgramTarget target,
                   Program& out, UnsupportedConstruct& unsupported) {
    out = Program{};
    out.group_count = re.group_count;
    try {
        Builder b(opts, target, out);
        Frag f = b.compile(*re.root);
        b.finish(f);
    } catch (const Overflow& o) {
        unsupported = UnsupportedConstruct{o.reason, o.offset};
        out = Program{};
        return false;
    }
    out.anchored_start = starts_anchored(*re.root);
    bool fold = false;
    collect_prefix(*re.root, out.literal_prefix, fold);
    out.prefix_fold = fold;
    return true;
}

std::string Program::dump() const {
    std::string s;
    char buf[128];
    for (size_t pc = 0; pc < insts.size(); ++pc) {
        const Inst& in = insts[pc];
        std::snprintf(buf, sizeof(buf), "%4zu%s %-8s", pc, (int)pc == start ? "*" : " ", op_name(in.op));
        s += buf;
        switch (in.op) {
            case Op::CHAR:
                std::snprintf(buf, sizeof(buf), " U+%04X%s -> %d", in.arg, in.flag ? " /i" : "", in.out);
                break;
            case Op::SPLIT:
            case Op::LOOK:
            case Op::ATOMIC:
                std::snprintf(buf, sizeof(buf), " -> %d, %d", in.out, in.out1);
                break;
            case Op::CLOOP:
                std::snprintf(buf, sizeof(buf), " c%u {%d,%d}%s -> %d, %d", in.arg, in.min, in.max,
                              in.flag ? "" : " lazy", in.out, in.out1);
                break;
            case Op::CINC:
                std::snprintf(buf, sizeof(buf), " c%u r%d -> %d", in.arg, in.reg, in.out);
                break;
            case Op::MATCH:
            case Op::SUCCEED:
                buf[0] = '\0';
                break;
            default:
                std::snprintf(buf, sizeof(buf), " %u -> %d", in.arg, in.out);
                break;
        }
        s += buf;
        s += '\n';
    }
    return s;
}

} // namespace safere::regex

#include "regex/Backtracker.hpp"
#include "regex/Errors.hpp"
#include "util/AsciiLower.hpp"
#include "util/Utf8.hpp"
#include <algorithm>

namespace safere::regex {

namespace {

// One entry on the choice stack: an alternative still to try, or a saved
// value to put back when backtracking past the instruction that changed it.
struct Frame {
    enum Kind : uint8_t { Branch, Cap, Counter, Reg } kind;
    int32_t index;   // Branch: pc
    long    value;   // Branch: position
};

// Scratch state of one search call.
class Machine {
public:
    Machine(const Program& prog, const std::string& pattern, std::string_view input,
            bool anchor_end, unsigned long long budget)
        : prog_(prog), pattern_(pattern), input_(input), anchor_end_(anchor_end), budget_(budget),
          caps_((size_t)prog.slot_count(), -1),
          counters_((size_t)prog.counter_count, 0),
          regs_((size_t)prog.register_count, -1) {}

    std::vector<long>& caps() { return caps_; }

    void reset(size_t start) {
        std::fill(caps_.begin(), caps_.end(), -1L);
        std::fill(counters_.begin(), counters_.end(), 0L);
        std::fill(regs_.begin(), regs_.end(), -1L);
        caps_[0] = (long)start;
        stack_.clear();
    }

    // Run from pc at pos until MATCH (or SUCCEED inside a sub-program).
    // require_end >= 0: SUCCEED only counts at that position.
    // On success the frames pushed by this run are left on the stack.
    bool run(int32_t pc0, size_t pos0, long require_end, size_t& end);

private:
    const Program& prog_;
    const std::string& pattern_;
    std::string_view input_;
    bool anchor_end_;
    unsigned long long budget_;
    unsigned long long steps_{0};

    std::vector<long> caps_;
    std::vector<long> counters_;
    std::vector<long> regs_;
    std::vector<Frame> stack_;

    void save(Frame::Kind kind, std::vector<long>& v, uint32_t i, long value) {
        stack_.push_back({kind, (int32_t)i, v[i]});
        v[i] = value;
    }

    bool backref(uint32_t group, bool fold, size_t& pos) const;
    bool lookbehind(int32_t sub, size_t pos);

    // Keep the state a successful sub-run produced, but make it undoable:
    // drop its frames and record the old values that differ.
    struct Snapshot { std::vector<long> caps, counters, regs; };
    Snapshot snapshot() const { return {caps_, counters_, regs_}; }
    void commit(size_t base, const Snapshot& s);
};

bool Machine::backref(uint32_t group, bool fold, size_t& pos) const {
    long s = caps_[2 * group];
    long e = caps_[2 * group + 1];
    if (s < 0 || e < 0) return false;
    std::string_view ref = input_.substr((size_t)s, (size_t)(e - s));
    if (!fold) {
        if (input_.substr(pos, ref.size()) != ref) return false;
        pos += ref.size();
        return true;
    }
    size_t i = 0, p = pos;
    while (i < ref.size()) {
        auto a = util::decode_at(ref, i);
        auto b = util::decode_at(input_, p);
        if (b.len == 0 || util::simple_fold(a.cp) != util::simple_fold(b.cp)) return false;
        i += (size_t)a.len;
        p += (size_t)b.len;
    }
    pos = p;
    return true;
}

void Machine::commit(size_t base, const Snapshot& s) {
    stack_.resize(base);
    for (size_t i = 0; i < caps_.size(); ++i)
        if (caps_[i] != s.caps[i]) stack_.push_back({Frame::Cap, (int32_t)i, s.caps[i]});
    for (size_t i = 0; i < counters_.size(); ++i)
        if (counters_[i] != s.counters[i]) stack_.push_back({Frame::Counter, (int32_t)i, s.counters[i]});
    for (size_t i = 0; i < regs_.size(); ++i)
        if (regs_[i] != s.regs[i]) stack_.push_back({Frame::Reg, (int32_t)i, s.regs[i]});
}

// Try every start position from pos backward, nearest first; the
// sub-program must end exactly at pos.
bool Machine::lookbehind(int32_t sub, size_t pos) {
    size_t start = pos;
    for (;;) {
        size_t end = 0;
        if (run(sub, start, (long)pos, end)) return true;
        if (start == 0) return false;
        start -= (size_t)util::prev_len(input_, start);
    }
}

bool Machine::run(int32_t pc0, size_t pos0, long require_end, size_t& end) {
    const size_t base = stack_.size();
    stack_.push_back({Frame::Branch, pc0, (long)pos0});

    while (stack_.size() > base) {
        Frame f = stack_.back();
        stack_.pop_back();
        switch (f.kind) {
            case Frame::Cap:     caps_[(size_t)f.index] = f.value; continue;
            case Frame::Counter: counters_[(size_t)f.index] = f.value; continue;
            case Frame::Reg:     regs_[(size_t)f.index] = f.value; continue;
            case Frame::Branch:  break;
        }

        int32_t pc = f.index;
        size_t pos = (size_t)f.value;
        bool alive = true;
        while (alive) {
            if (++steps_ > budget_) throw FallbackTimeout(pattern_, budget_);
            const Inst& in = prog_.insts[(size_t)pc];
            switch (in.op) {
                case Op::CHAR:
                case Op::CLASS:
                case Op::ANY: {
                    auto d = util::decode_at(input_, pos);
                    if (d.len == 0 || !char_matches(prog_, in, d.cp)) { alive = false; break; }
                    pos += (size_t)d.len;
                    pc = in.out;
                    break;
                }
                case Op::SPLIT:
                    stack_.push_back({Frame::Branch, in.out1, (long)pos});
                    pc = in.out;
                    break;
                case Op::JMP:
                    pc = in.out;
                    break;
                case Op::SAVE:
                    save(Frame::Cap, caps_, in.arg, (long)pos);
                    pc = in.out;
                    break;
                case Op::ASSERT:
                    if (!check_assert((AssertKind)in.arg, input_, pos)) { alive = false; break; }
                    pc = in.out;
                    break;
                case Op::MARK:
                    save(Frame::Reg, regs_, in.arg, (long)pos);
                    pc = in.out;
                    break;
                case Op::CHECK:
                    // A nullable loop body that consumed nothing ends the loop.
                    if (regs_[in.arg] == (long)pos) { alive = false; break; }
                    pc = in.out;
                    break;
                case Op::CINIT:
                    save(Frame::Counter, counters_, in.arg, 0);
                    pc = in.out;
                    break;
                case Op::CLOOP: {
                    long n = counters_[in.arg];
                    bool more = in.max == -1 || n < in.max;
                    bool done = n >= in.min;
                    if (more && done) {
                        stack_.push_back({Frame::Branch, in.flag ? in.out1 : in.out, (long)pos});
                        pc = in.flag ? in.out : in.out1;
                    } else if (more) {
                        pc = in.out;
                    } else if (done) {
                        pc = in.out1;
                    } else {
                        alive = false;
                    }
                    break;
                }
                case Op::CINC: {
                    const Inst& loop = prog_.insts[(size_t)in.out];
                    long n = counters_[in.arg];
                    if (in.reg >= 0 && loop.max == -1 && n >= loop.min && regs_[(size_t)in.reg] == (long)pos) {
                        alive = false;
                        break;
                    }
                    save(Frame::Counter, counters_, in.arg, n + 1);
                    pc = in.out;
                    break;
                }
                case Op::BACKREF:
                    if (!backref(in.arg, in.flag, pos)) { alive = false; break; }
                    pc = in.out;
                    break;
                case Op::LOOK: {
                    const size_t sub_base = stack_.size();
                    Snapshot snap = snapshot();
                    bool found;
                    if (in.behind) {
                        found = lookbehind(in.out1, pos);
                    } else {
                        size_t sub_end = 0;
                        found = run(in.out1, pos, -1, sub_end);
                    }
                    if (found == in.flag) {
                        // Unwind without keeping anything the sub-run set.
                        stack_.resize(sub_base);
                        caps_ = std::move(snap.caps);
                        counters_ = std::move(snap.counters);
                        regs_ = std::move(snap.regs);
                        alive = false;
                        break;
                    }
                    if (found) commit(sub_base, snap);
                    pc = in.out;
                    break;
                }
                case Op::ATOMIC: {
                    const size_t sub_base = stack_.size();
                    Snapshot snap = snapshot();
                    size_t sub_end = 0;
                    if (!run(in.out1, pos, -1, sub_end)) { alive = false; break; }
                    commit(sub_base, snap);
                    pos = sub_end;
                    pc = in.out;
                    break;
                }
                case Op::SUCCEED:
                    if (require_end >= 0 && (long)pos != require_end) { alive = false; break; }
                    end = pos;
                    return true;
                case Op::MATCH:
                    if (anchor_end_ && pos != input_.size()) { alive = false; break; }
                    end = pos;
                    return true;
            }
        }
    }
    return false;
}

} // namespace

Backtracker::Backtracker(std::string pattern, Program prog, std::vector<std::pair<std::string, int>> names,
                         unsigned long long step_budget)
    : CompiledEngine(std::move(pattern), prog.group_count, std::move(names)),
      prog_(std::move(prog)),
      prefix_(prog_.anchored_start ? std::string() : prog_.literal_prefix, prog_.prefix_fold),
      step_budget_(step_budget) {}

std::string Backtracker::explain() const {
    std::string s = "engine: fallback\nstep budget: " + std::to_string(step_budget_) + "\n";
    if (prog_.anchored_start) s += "anchored: start\n";
    if (!prefix_.empty()) s += "prefix: \"" + prefix_.pattern() + "\"\n";
    return s + prog_.dump();
}

std::optional<MatchResult> Backtracker::search(std::string_view input, size_t from,
                                               bool anchor_start, bool anchor_end) const {
    if (from > input.size()) return std::nullopt;
    if (prog_.anchored_start && from > 0) return std::nullopt;

    const bool only_start = anchor_start || prog_.anchored_start;
    Machine m(prog_, pattern(), input, anchor_end, step_budget_);
    size_t start = from;
    for (;;) {
        if (!only_start && !prefix_.empty()) {
            size_t hit = prefix_.search(input, start);
            if (hit == util::BoyerMooreSearch::npos) return std::nullopt;
            start = hit;
        }
        m.reset(start);
        size_t end = 0;
        if (m.run(prog_.start, start, -1, end)) {
            m.caps()[1] = (long)end;
            return to_result(m.caps(), prog_.group_count);
        }
        if (only_start || start >= input.size()) return std::nullopt;
        start += (size_t)util::decode_at(input, start).len;
    }
}

} // namespace safere::regex

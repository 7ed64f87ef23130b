#include "regex/ThompsonNFA.hpp"
#include "util/Utf8.hpp"
#include <algorithm>

namespace safere::regex {

namespace {

// +1 when entries rise along the deque, -1 when they fall, 0 below two members.
template <typename Members>
int direction(const Members& m) {
    if (m.size() < 2) return 0;
    return m[1].entry > m[0].entry ? 1 : -1;
}

// Split off the first k members, moving whichever side is shorter.
template <typename Members>
Members take_front(Members& m, size_t k) {
    Members head;
    if (k * 2 <= m.size()) {
        for (size_t i = 0; i < k; ++i) {
            head.push_back(std::move(m.front()));
            m.pop_front();
        }
        return head;
    }
    Members tail;
    while (m.size() > k) {
        tail.push_front(std::move(m.back()));
        m.pop_back();
    }
    head = std::move(m);
    m = std::move(tail);
    return head;
}

} // namespace

// ── Construction ───────────────────────────────────────────────────────

ThompsonNFA::ThompsonNFA(std::string pattern, Program prog, std::vector<std::pair<std::string, int>> names)
    : CompiledEngine(std::move(pattern), prog.group_count, std::move(names)),
      prog_(std::move(prog)),
      prefix_(prog_.anchored_start ? std::string() : prog_.literal_prefix, prog_.prefix_fold),
      row_size_((size_t)prog_.slot_count()) {}

std::string ThompsonNFA::explain() const {
    std::string s = "engine: automaton\n";
    if (prog_.anchored_start) s += "anchored: start\n";
    if (!prefix_.empty()) s += "prefix: \"" + prefix_.pattern() + "\"\n";
    return s + prog_.dump();
}

void ThompsonNFA::ThreadList::reset(size_t nprog, size_t ncounters) {
    seen.assign(nprog, 0);
    saturated.assign(ncounters, 0);
    gen = 1;
}

void ThompsonNFA::ThreadList::clear() {
    pcs.clear();
    rows.clear();
    bundle_of.clear();
    bundles.clear();
    if (++gen == 0) {
        std::fill(seen.begin(), seen.end(), 0u);
        std::fill(saturated.begin(), saturated.end(), 0u);
        gen = 1;
    }
}

// ── Epsilon closure ────────────────────────────────────────────────────

void ThompsonNFA::add_thread(ThreadList& list, int32_t pc0, std::string_view input, size_t pos, long step,
                             long* row, std::vector<Job>& stack) const {
    stack.push_back({pc0, 0, 0});

    while (!stack.empty()) {
        Job j = stack.back();
        stack.pop_back();
        if (j.pc < 0) {
            row[j.slot] = j.value;
            continue;
        }

        int32_t pc = j.pc;
        while (pc >= 0) {
            // Counter loop states are only reached through CINIT, which is
            // itself visited once per list.
            int32_t counter = prog_.live_counter[(size_t)pc];
            if (counter < 0) {
                if (list.seen[(size_t)pc] == list.gen) break;
                list.seen[(size_t)pc] = list.gen;
            }

            const Inst& in = prog_.insts[(size_t)pc];
            switch (in.op) {
                case Op::JMP:
                case Op::MARK:
                case Op::CHECK:
                case Op::CINIT:
                    pc = in.out;
                    break;
                case Op::SPLIT:
                    stack.push_back({in.out1, 0, 0});
                    pc = in.out;
                    break;
                case Op::SAVE:
                    stack.push_back({-1, (int32_t)in.arg, row[in.arg]});
                    row[in.arg] = (long)pos;
                    pc = in.out;
                    break;
                case Op::ASSERT:
                    pc = check_assert((AssertKind)in.arg, input, pos) ? in.out : -1;
                    break;
                case Op::CLOOP:
                    // Fresh from CINIT: the counter is zero and max is at least one.
                    if (in.min == 0) {
                        stack.push_back({in.flag ? in.out1 : in.out, 0, 0});
                        pc = in.flag ? in.out : in.out1;
                    } else {
                        pc = in.out;
                    }
                    break;
                case Op::CHAR:
                case Op::CLASS:
                case Op::ANY:
                case Op::MATCH:
                    if (counter >= 0) {
                        std::deque<Member> fresh;
                        fresh.push_back(Member{step, std::vector<long>(row, row + row_size_)});
                        push_members(list, pc, counter, std::move(fresh));
                    } else {
                        list.pcs.push_back(pc);
                        list.rows.insert(list.rows.end(), row, row + row_size_);
                        list.bundle_of.push_back(-1);
                    }
                    pc = -1;
                    break;
                default:
                    // Backtracking-only instruction; never emitted for this engine.
                    pc = -1;
                    break;
            }
        }
    }
}

int32_t ThompsonNFA::follow_assertions(int32_t pc, std::string_view input, size_t pos) const {
    while (pc >= 0) {
        const Inst& in = prog_.insts[(size_t)pc];
        if (in.op == Op::JMP)
            pc = in.out;
        else if (in.op == Op::ASSERT)
            pc = check_assert((AssertKind)in.arg, input, pos) ? in.out : -1;
        else
            break;
    }
    return pc;
}

// ── Counter bundles ────────────────────────────────────────────────────

// Append members at pc, joining the bundle at the tail of the list when the
// entries keep one direction.
void ThompsonNFA::push_members(ThreadList& list, int32_t pc, int32_t counter, std::deque<Member> members) const {
    if (members.empty()) return;
    if (!list.pcs.empty() && list.pcs.back() == pc && list.bundle_of.back() >= 0) {
        Bundle& tail = list.bundles[(size_t)list.bundle_of.back()];
        int across = members.front().entry > tail.members.back().entry ? 1 : -1;
        int a = direction(tail.members);
        int b = direction(members);
        if ((a == 0 || a == across) && (b == 0 || b == across)) {
            if (members.size() <= tail.members.size()) {
                for (auto& m : members) tail.members.push_back(std::move(m));
            } else {
                for (auto it = tail.members.rbegin(); it != tail.members.rend(); ++it)
                    members.push_front(std::move(*it));
                tail.members = std::move(members);
            }
            return;
        }
    }
    list.pcs.push_back(pc);
    list.rows.resize(list.rows.size() + row_size_, -1L);
    list.bundle_of.push_back((int32_t)list.bundles.size());
    list.bundles.push_back(Bundle{counter, std::move(members)});
}

// Every member consumes cp and runs CINC then CLOOP. A member's counter is
// step - entry; for an unbounded loop it stops at min. Only the first member
// able to leave the loop runs the exit closure: the ones after it would visit
// the same states at the same position.
void ThompsonNFA::step_bundle(int32_t pc, Bundle& bundle, ThreadList& list, std::string_view input, size_t pos,
                              long step, uint32_t cp, std::vector<Job>& stack) const {
    const Inst& test = prog_.insts[(size_t)pc];
    if (!char_matches(prog_, test, cp)) return;
    if (follow_assertions(test.out, input, pos) < 0) return;

    const Inst& loop = prog_.insts[(size_t)prog_.counter_loop[(size_t)bundle.counter]];
    const bool body_open = follow_assertions(loop.out, input, pos) == pc;
    auto& m = bundle.members;
    const int dir = direction(m);
    const bool unbounded = loop.max == -1;

    if (unbounded) {
        // Members at min are interchangeable; the first one on the list wins.
        size_t k = 0;
        while (k < m.size() && step - (dir >= 0 ? m[k] : m[m.size() - 1 - k]).entry >= loop.min) ++k;
        if (k > 0) {
            size_t keep = list.saturated[(size_t)bundle.counter] == list.gen ? 0 : 1;
            if (dir >= 0) {
                m.erase(m.begin() + (long)keep, m.begin() + (long)k);
            } else {
                m.erase(m.end() - (long)k + (long)keep, m.end());
            }
            list.saturated[(size_t)bundle.counter] = list.gen;
        }
        if (m.empty()) return;
    }

    // Members that reached min form a prefix (rising entries) or a suffix.
    const long limit = step - loop.min;
    size_t first = m.size();
    if (dir >= 0) {
        if (m.front().entry <= limit) first = 0;
    } else {
        first = (size_t)(std::partition_point(m.begin(), m.end(),
                                              [&](const Member& x) { return x.entry > limit; }) - m.begin());
    }
    const bool run_exit = first < m.size() && list.seen[(size_t)loop.out1] != list.gen;

    // The oldest member of a bounded loop leaves once it reaches max.
    bool at_max = false;
    size_t oldest = dir >= 0 ? 0 : m.size() - 1;
    if (!unbounded && step - m[oldest].entry >= loop.max) at_max = true;

    if (!run_exit) {
        if (!body_open) return;
        if (at_max) {
            if (dir >= 0) m.pop_front();
            else m.pop_back();
        }
        push_members(list, pc, bundle.counter, std::move(m));
        return;
    }

    std::vector<long> exit_row = m[first].slots;
    if (!body_open) {
        add_thread(list, loop.out1, input, pos, step, exit_row.data(), stack);
        return;
    }

    // Greedy loops try another round before leaving; lazy ones leave first.
    size_t cut = loop.flag ? first + 1 : first;
    if (at_max) {
        if (oldest < cut) --cut;
        if (dir >= 0) m.pop_front();
        else m.pop_back();
    }
    push_members(list, pc, bundle.counter, take_front(m, cut));
    add_thread(list, loop.out1, input, pos, step, exit_row.data(), stack);
    push_members(list, pc, bundle.counter, std::move(m));
}

// ── Simulation ─────────────────────────────────────────────────────────

std::optional<MatchResult> ThompsonNFA::search(std::string_view input, size_t from,
                                               bool anchor_start, bool anchor_end) const {
    if (from > input.size()) return std::nullopt;
    if (prog_.anchored_start && from > 0) return std::nullopt;

    const bool only_start = anchor_start || prog_.anchored_start;
    const size_t nprog = prog_.insts.size();
    const size_t slots = (size_t)prog_.slot_count();

    ThreadList clist, nlist;
    clist.reset(nprog, prog_.counter_loop.size());
    nlist.reset(nprog, prog_.counter_loop.size());
    std::vector<long> row(row_size_, -1);
    std::vector<Job> stack;
    std::vector<long> best;
    bool matched = false;
    size_t pos = from;
    long step = 0;

    for (;;) {
        // Seed a new thread at the lowest priority until something matches.
        if (!matched && (!only_start || pos == from)) {
            if (!only_start && clist.pcs.empty() && !prefix_.empty()) {
                size_t hit = prefix_.search(input, pos);
                if (hit == util::BoyerMooreSearch::npos) break;
                pos = hit;
            }
            std::fill(row.begin(), row.end(), -1L);
            row[0] = (long)pos;
            add_thread(clist, prog_.start, input, pos, step, row.data(), stack);
        }
        if (clist.pcs.empty() && (matched || only_start)) break;

        util::Decoded d = util::decode_at(input, pos);
        const size_t next = pos + (size_t)d.len;
        nlist.clear();
        for (size_t i = 0; i < clist.pcs.size(); ++i) {
            const int32_t pc = clist.pcs[i];
            if (clist.bundle_of[i] >= 0) {
                if (d.len > 0)
                    step_bundle(pc, clist.bundles[(size_t)clist.bundle_of[i]], nlist, input, next,
                                step + 1, d.cp, stack);
                continue;
            }
            const Inst& in = prog_.insts[(size_t)pc];
            long* r = &clist.rows[i * row_size_];
            if (in.op == Op::MATCH) {
                if (anchor_end && pos != input.size()) continue;
                best.assign(r, r + slots);
                best[1] = (long)pos;
                matched = true;
                // Lower-priority threads can no longer win.
                break;
            }
            if (d.len > 0 && char_matches(prog_, in, d.cp))
                add_thread(nlist, in.out, input, next, step + 1, r, stack);
        }

        if (pos >= input.size()) break;
        pos = next;
        ++step;
        std::swap(clist, nlist);
    }

    if (!matched) return std::nullopt;
    return to_result(best, prog_.group_count);
}

bool ThompsonNFA::full_match(std::string_view input) const {
    return search(input, 0, true, true).has_value();
}

} // namespace safere::regex

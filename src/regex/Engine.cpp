#include "regex/Engine.hpp"
#include "util/Utf8.hpp"

namespace safere::regex {

const char* engine_kind_name(EngineKind k) {
    return k == EngineKind::Automaton ? "automaton" : "fallback";
}

int CompiledEngine::group_index(std::string_view name) const {
    for (auto& [n, i] : names_)
        if (n == name) return i;
    return -1;
}

MatchResult CompiledEngine::to_result(const std::vector<long>& slots, int group_count) {
    MatchResult m;
    m.full = {(size_t)slots[0], (size_t)slots[1]};
    m.groups.resize((size_t)group_count);
    for (int g = 1; g <= group_count; ++g) {
        long s = slots[(size_t)(2 * g)];
        long e = slots[(size_t)(2 * g + 1)];
        if (s >= 0 && e >= 0) m.groups[(size_t)g - 1] = Span{(size_t)s, (size_t)e};
    }
    return m;
}

std::optional<MatchResult> CompiledEngine::match(std::string_view input) const {
    return search(input, 0, false, false);
}

std::vector<MatchResult> CompiledEngine::match_all(std::string_view input) const {
    return run(input, MatchMode::FindAll);
}

std::vector<MatchResult> CompiledEngine::run(std::string_view input, MatchMode mode) const {
    std::vector<MatchResult> out;
    switch (mode) {
        case MatchMode::FindFirst:
        case MatchMode::AnchoredPrefix:
        case MatchMode::AnchoredSuffix: {
            auto m = search(input, 0, mode == MatchMode::AnchoredPrefix, mode == MatchMode::AnchoredSuffix);
            if (m) out.push_back(std::move(*m));
            return out;
        }
        case MatchMode::FindAll:
            break;
    }

    size_t pos = 0;
    while (pos <= input.size()) {
        auto m = search(input, pos, false, false);
        if (!m) break;
        Span s = m->full;
        out.push_back(std::move(*m));
        if (!s.empty()) {
            pos = s.end;
            continue;
        }
        // Empty match: step one code point past its start to guarantee progress.
        if (s.start >= input.size()) break;
        pos = s.start + (size_t)safere::util::decode_at(input, s.start).len;
    }
    return out;
}

} // namespace safere::regex

#include "ops/StringOps.hpp"
#include "app/Config.hpp"
#include "regex/Match.hpp"

namespace safere::ops {

regex::EngineSelector& default_selector() {
    static regex::EngineSelector sel([] {
        const auto& c = app::config();
        regex::SelectorOptions o;
        o.capacity = c.cache_capacity;
        o.compile = c.compile_options();
        o.step_budget = c.step_budget;
        o.fallback_advisory = c.fallback_advisory;
        o.verbose = c.verbose;
        return o;
    }());
    return sel;
}

std::string escape(std::string_view literal) {
    std::string out;
    out.reserve(literal.size() * 2);
    for (char c : literal) {
        auto u = (unsigned char)c;
        bool plain = u >= 0x80 || (u >= '0' && u <= '9') || (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') || u == '_';
        if (!plain) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

std::vector<std::string> split(std::string_view s, const regex::CompiledEngine& re, long limit) {
    std::vector<std::string> pieces;
    size_t last = 0;
    long splits = 0;
    for (const auto& m : re.run(s, regex::MatchMode::FindAll)) {
        if (limit > 0 && splits >= limit - 1) break;
        pieces.emplace_back(s.substr(last, m.full.start - last));
        for (long g = 1; g <= (long)m.groups.size(); ++g) pieces.emplace_back(m.text(s, g));
        last = m.full.end;
        ++splits;
    }
    pieces.emplace_back(s.substr(last));
    return pieces;
}

std::string regexp_replace(std::string_view s, const regex::CompiledEngine& re, std::string_view replacement) {
    auto matches = re.run(s, regex::MatchMode::FindAll);
    if (matches.empty()) return std::string(s);
    std::string out;
    out.reserve(s.size() + matches.size() * replacement.size());
    size_t last = 0;
    for (const auto& m : matches) {
        out.append(s.substr(last, m.full.start - last));
        out.append(replacement);
        last = m.full.end;
    }
    out.append(s.substr(last));
    return out;
}

std::string regexp_extract(std::string_view s, const regex::CompiledEngine& re, long idx) {
    auto m = re.match(s);
    if (!m) return {};
    return std::string(m->text(s, idx));
}

bool rlike(std::string_view s, const regex::CompiledEngine& re) {
    return re.match(s).has_value();
}

std::vector<std::string> split(std::string_view s, std::string_view pattern, long limit, regex::EngineSelector& sel) {
    return split(s, *sel.select(pattern), limit);
}

std::string regexp_replace(std::string_view s, std::string_view pattern, std::string_view replacement,
                           regex::EngineSelector& sel) {
    return regexp_replace(s, *sel.select(pattern), replacement);
}

std::string regexp_extract(std::string_view s, std::string_view pattern, long idx, regex::EngineSelector& sel) {
    return regexp_extract(s, *sel.select(pattern), idx);
}

bool rlike(std::string_view s, std::string_view pattern, regex::EngineSelector& sel) {
    return rlike(s, *sel.select(pattern));
}

bool startswith(std::string_view s, std::string_view literal, regex::EngineSelector& sel) {
    auto re = sel.select(escape(literal));
    return !re->run(s, regex::MatchMode::AnchoredPrefix).empty();
}

bool endswith(std::string_view s, std::string_view literal, regex::EngineSelector& sel) {
    auto re = sel.select(escape(literal));
    return !re->run(s, regex::MatchMode::AnchoredSuffix).empty();
}

} // namespace safere::ops

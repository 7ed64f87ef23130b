#include "regex/EngineSelector.hpp"
#include "regex/Compiler.hpp"
#include "regex/Errors.hpp"
#include <cstdio>
#include <variant>

namespace safere::regex {

EngineSelector::EngineSelector(SelectorOptions opts) : opts_(std::move(opts)) {
    if (opts_.capacity == 0) opts_.capacity = 1;
}

std::shared_ptr<EngineSelector::Entry> EngineSelector::lookup(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = map_.find(key);
    if (it != map_.end()) {
        ++stats_.hits;
        lru_.splice(lru_.begin(), lru_, it->second.lru);
        return it->second.entry;
    }

    ++stats_.misses;
    lru_.push_front(key);
    auto entry = std::make_shared<Entry>();
    map_.emplace(key, Slot{entry, lru_.begin()});
    // Evicted entries stay alive for callers still holding them.
    while (map_.size() > opts_.capacity) {
        const std::string& victim = lru_.back();
        if (opts_.verbose)
            std::fprintf(stderr, "safere: EngineSelector: evicting '%s'\n", victim.c_str());
        map_.erase(victim);
        lru_.pop_back();
        ++stats_.evictions;
    }
    return entry;
}

void EngineSelector::forget(const std::string& key, const std::shared_ptr<Entry>& entry) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = map_.find(key);
    if (it == map_.end() || it->second.entry != entry) return;
    lru_.erase(it->second.lru);
    map_.erase(it);
}

EngineHandle EngineSelector::build(const std::string& pattern) {
    CompileResult r = compile(pattern, opts_.compile);
    if (auto* nfa = std::get_if<std::unique_ptr<ThompsonNFA>>(&r)) {
        if (opts_.verbose)
            std::fprintf(stderr, "safere: EngineSelector: compiled '%s' as automaton (%zu insts)\n",
                         pattern.c_str(), (*nfa)->program().insts.size());
        return EngineHandle(std::move(*nfa));
    }

    const auto& why = std::get<UnsupportedConstruct>(r);
    auto engine = compile_fallback(pattern, opts_.compile, opts_.step_budget);

    bool advise = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        ++stats_.fallbacks;
        advise = opts_.fallback_advisory && advised_.insert(pattern).second;
    }
    if (advise)
        std::fprintf(stderr,
                     "safere: EngineSelector: pattern '%s' needs the backtracking engine (%s at offset %zu); "
                     "matching is not linear time\n",
                     pattern.c_str(), why.reason.c_str(), why.offset);
    return EngineHandle(std::move(engine));
}

EngineHandle EngineSelector::select(std::string_view pattern) {
    std::string key(pattern);
    auto entry = lookup(key);

    std::call_once(entry->once, [&] {
        try {
            entry->handle = build(key);
        } catch (const std::exception&) {
            entry->error = std::current_exception();
        }
    });

    if (entry->error) {
        forget(key, entry);
        std::rethrow_exception(entry->error);
    }
    return entry->handle;
}

SelectorStats EngineSelector::stats() const {
    std::lock_guard<std::mutex> lk(mu_);
    SelectorStats s = stats_;
    s.size = map_.size();
    return s;
}

void EngineSelector::clear() {
    std::lock_guard<std::mutex> lk(mu_);
    map_.clear();
    lru_.clear();
    advised_.clear();
    stats_ = SelectorStats{};
}

} // namespace safere::regex

#pragma once

#include <cstdint>
#include <exception>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include "regex/Engine.hpp"
#include "regex/Program.hpp"

namespace safere::regex {

struct SelectorOptions {
    size_t capacity{512};
    CompileOptions compile{};
    unsigned long long step_budget{10'000'000ULL};
    bool fallback_advisory{true};
    bool verbose{false};
};

struct SelectorStats {
    uint64_t hits{0};
    uint64_t misses{0};
    uint64_t fallbacks{0};
    uint64_t evictions{0};
    size_t   size{0};
};

// Pattern text -> compiled engine, compiled once and shared.
// Tries the automaton first and routes to the backtracker only on an
// explicit UnsupportedConstruct. Thread-safe; the lock is never held while
// compiling, and concurrent first requests for one pattern compile once.
class EngineSelector {
public:
    explicit EngineSelector(SelectorOptions opts = {});

    EngineSelector(const EngineSelector&) = delete;
    EngineSelector& operator=(const EngineSelector&) = delete;

    // Throws PatternSyntaxError; errors are never cached.
    [[nodiscard]] EngineHandle select(std::string_view pattern);

    [[nodiscard]] SelectorStats stats() const;
    [[nodiscard]] const SelectorOptions& options() const { return opts_; }
    void clear();

private:
    struct Entry {
        std::once_flag once;
        EngineHandle handle;
        std::exception_ptr error;
    };
    struct Slot {
        std::shared_ptr<Entry> entry;
        std::list<std::string>::iterator lru;
    };

    SelectorOptions opts_;

    mutable std::mutex mu_;
    std::list<std::string> lru_;   // most recently used first
    std::unordered_map<std::string, Slot> map_;
    std::unordered_set<std::string> advised_;
    SelectorStats stats_;

    std::shared_ptr<Entry> lookup(const std::string& key);
    void forget(const std::string& key, const std::shared_ptr<Entry>& entry);
    EngineHandle build(const std::string& pattern);
};

} // namespace safere::regex

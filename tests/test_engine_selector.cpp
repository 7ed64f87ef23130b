#include "minitest.hpp"
#include "regex/EngineSelector.hpp"
#include "regex/Errors.hpp"
#include <atomic>
#include <thread>
#include <vector>

using safere::regex::EngineKind;
using safere::regex::EngineSelector;
using safere::regex::PatternSyntaxError;
using safere::regex::SelectorOptions;

static SelectorOptions quiet(size_t capacity = 64) {
    SelectorOptions o;
    o.capacity = capacity;
    o.fallback_advisory = false;
    return o;
}

TEST(selector_routes_by_construct) {
    EngineSelector sel(quiet());
    ASSERT_TRUE(sel.select("a+b")->kind() == EngineKind::Automaton);
    ASSERT_TRUE(sel.select("(a)\\1")->kind() == EngineKind::Fallback);
    ASSERT_TRUE(sel.select("x(?=y)")->kind() == EngineKind::Fallback);
    auto st = sel.stats();
    ASSERT_EQ(st.misses, 3u);
    ASSERT_EQ(st.fallbacks, 2u);
    ASSERT_EQ(st.size, 3u);
}

TEST(selector_fallback_still_matches) {
    EngineSelector sel(quiet());
    auto re = sel.select("(a)\\1");
    auto m = re->match("aa");
    ASSERT_TRUE(m.has_value());
    ASSERT_EQ(m->full.start, 0u);
    ASSERT_EQ(m->full.end, 2u);
    ASSERT_TRUE(!re->match("ab").has_value());
}

TEST(selector_oversized_program_routes_to_fallback) {
    SelectorOptions o = quiet();
    o.compile.max_program_size = 50;
    o.compile.replicate_limit = 0;
    EngineSelector sel(o);
    auto re = sel.select("(a{3}){40}");
    ASSERT_TRUE(re->kind() == EngineKind::Fallback);
    ASSERT_TRUE(re->match(std::string(120, 'a')).has_value());
}

TEST(selector_caches_handles) {
    EngineSelector sel(quiet());
    auto a = sel.select("abc");
    auto b = sel.select("abc");
    ASSERT_TRUE(a.get() == b.get());
    ASSERT_EQ(sel.stats().hits, 1u);
    ASSERT_EQ(sel.stats().misses, 1u);
}

TEST(selector_syntax_error_not_cached) {
    EngineSelector sel(quiet());
    ASSERT_THROWS(sel.select("(ab"), PatternSyntaxError);
    ASSERT_THROWS(sel.select("(ab"), PatternSyntaxError);
    auto st = sel.stats();
    ASSERT_EQ(st.size, 0u);
    ASSERT_EQ(st.misses, 2u);
    ASSERT_EQ(st.hits, 0u);
}

TEST(selector_lru_eviction_keeps_results) {
    EngineSelector sel(quiet(2));
    auto first = sel.select("a+")->match("baa");
    (void)sel.select("b+");
    (void)sel.select("a+");          // refresh a+
    (void)sel.select("c+");          // evicts b+
    auto st = sel.stats();
    ASSERT_EQ(st.evictions, 1u);
    ASSERT_EQ(st.size, 2u);
    ASSERT_EQ(st.hits, 1u);
    (void)sel.select("b+");          // recompiled, evicts a+
    ASSERT_EQ(sel.stats().misses, 4u);
    ASSERT_EQ(sel.select("a+")->match("baa"), first);
}

TEST(selector_evicted_handle_stays_usable) {
    EngineSelector sel(quiet(1));
    auto held = sel.select("x+");
    (void)sel.select("y+");
    ASSERT_EQ(sel.stats().size, 1u);
    ASSERT_TRUE(held->match("axx").has_value());
}

TEST(selector_concurrent_first_access_compiles_once) {
    EngineSelector sel(quiet());
    std::atomic<int> go{0};
    std::vector<const void*> seen(8, nullptr);
    {
        std::vector<std::jthread> pool;
        for (int t = 0; t < 8; ++t) {
            pool.emplace_back([&, t] {
                while (go.load() == 0) std::this_thread::yield();
                const void* last = nullptr;
                for (int i = 0; i < 200; ++i) {
                    auto h = sel.select("(\\w+)@(\\w+)\\.org");
                    if (!h->match("mail me@host.org")) return;
                    last = h.get();
                }
                seen[(size_t)t] = last;
            });
        }
        go.store(1);
    }
    for (auto* p : seen) {
        ASSERT_TRUE(p != nullptr);
        ASSERT_TRUE(p == seen[0]);
    }
    auto st = sel.stats();
    ASSERT_EQ(st.misses, 1u);
    ASSERT_EQ(st.hits, 8u * 200u - 1u);
}

TEST(selector_clear_resets) {
    EngineSelector sel(quiet());
    (void)sel.select("a");
    (void)sel.select("(a)\\1");
    sel.clear();
    auto st = sel.stats();
    ASSERT_EQ(st.size, 0u);
    ASSERT_EQ(st.misses, 0u);
    ASSERT_EQ(st.fallbacks, 0u);
}

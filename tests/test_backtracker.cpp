#include "minitest.hpp"
#include "regex/Compiler.hpp"
#include <string>

using safere::regex::Backtracker;
using safere::regex::CompileOptions;
using safere::regex::FallbackTimeout;
using safere::regex::MatchMode;
using safere::regex::Span;

static std::unique_ptr<Backtracker> bt(std::string_view pattern, unsigned long long budget = 1'000'000) {
    return safere::regex::compile_fallback(pattern, CompileOptions{}, budget);
}

static Span find(std::string_view pattern, std::string_view input) {
    auto m = bt(pattern)->match(input);
    if (!m) return Span{999, 999};
    return m->full;
}

// ============================================================================
// BACKREFERENCES
// ============================================================================

TEST(bt_backreference) {
    auto m = bt("(a+)\\1")->match("aaaa");
    ASSERT_TRUE(m.has_value());
    ASSERT_EQ(m->full, (Span{0, 4}));
    ASSERT_EQ(*m->group(1), (Span{0, 2}));
    ASSERT_EQ(find("(a)\\1", "xaa"), (Span{1, 3}));
    ASSERT_TRUE(!bt("(a)\\1")->match("ab").has_value());
}

TEST(bt_named_backreference) {
    auto m = bt("(?P<q>['\"]).*?(?P=q)")->match("say \"hi' there\" ok");
    ASSERT_EQ(m->full, (Span{4, 15}));
}

TEST(bt_backreference_case_folded) {
    ASSERT_EQ(find("(?i)(ab)\\1", "xAbaB"), (Span{1, 5}));
    ASSERT_TRUE(!bt("(ab)\\1")->match("abAB").has_value());
}

TEST(bt_backreference_to_unset_group_fails) {
    ASSERT_TRUE(!bt("(a)?b\\1")->match("b").has_value());
    ASSERT_EQ(find("(a)?b\\1", "aba"), (Span{0, 3}));
}

// ============================================================================
// LOOKAROUND
// ============================================================================

TEST(bt_lookahead) {
    ASSERT_EQ(find("foo(?=bar)", "foobaz foobar"), (Span{7, 10}));
    ASSERT_EQ(find("foo(?!bar)", "foobar foobaz"), (Span{7, 10}));
    ASSERT_EQ(find("(?=\\d)\\w+", "ab 12c"), (Span{3, 6}));
}

TEST(bt_lookahead_keeps_captures) {
    auto m = bt("(?=(\\w+))a")->match("abc");
    ASSERT_EQ(m->full, (Span{0, 1}));
    ASSERT_EQ(*m->group(1), (Span{0, 3}));
}

TEST(bt_lookbehind) {
    ASSERT_EQ(find("(?<=\\$)\\d+", "cost $42"), (Span{6, 8}));
    ASSERT_EQ(find("(?<!\\$)\\b\\d+", "$42 17"), (Span{4, 6}));
    ASSERT_EQ(find("(?<=ab|xyz)c", "xyzc"), (Span{3, 4}));
    ASSERT_EQ(find("(?<=^)a", "a"), (Span{0, 1}));
}

TEST(bt_lookbehind_over_multibyte) {
    ASSERT_EQ(find("(?<=\xc3\xa9)x", "\xc3\xa9x"), (Span{2, 3}));
}

// ============================================================================
// ATOMIC AND POSSESSIVE
// ============================================================================

TEST(bt_atomic_group_does_not_give_back) {
    ASSERT_EQ(find("(?>a+)b", "aaab"), (Span{0, 4}));
    ASSERT_TRUE(!bt("(?>a+)ab")->match("aaab").has_value());
    ASSERT_TRUE(!bt("a*+a")->match("aaa").has_value());
    ASSERT_EQ(find("a?+a", "aa"), (Span{0, 2}));
    ASSERT_EQ(find("(?>x|xy)z", "xyz xz"), (Span{4, 6}));
}

// ============================================================================
// SHARED DIALECT
// ============================================================================

TEST(bt_same_leftmost_first_semantics) {
    ASSERT_EQ(find("a|ab", "ab"), (Span{0, 1}));
    ASSERT_EQ(find("a+?", "aaa"), (Span{0, 1}));
    ASSERT_EQ(find("(?m)^b$", "a\nb\nc"), (Span{2, 3}));
}

TEST(bt_empty_loop_body_terminates) {
    ASSERT_EQ(find("(a*)*b", "aab"), (Span{0, 3}));
    ASSERT_EQ(find("(a|)*c", "aac"), (Span{0, 3}));
    ASSERT_EQ(find("(?:x?){3,}y", "y"), (Span{0, 1}));
}

TEST(bt_counted_loops_nest) {
    CompileOptions o;
    o.replicate_limit = 0;
    auto e = safere::regex::compile_fallback("(a{2}){3}\\1", o, 1'000'000);
    ASSERT_EQ(e->match("aaaaaaaa")->full, (Span{0, 8}));
    ASSERT_TRUE(!e->match("aaaaaaa").has_value());
}

TEST(bt_find_all) {
    auto all = bt("(\\w)\\1")->run("aabbcd ee", MatchMode::FindAll);
    ASSERT_EQ(all.size(), 3u);
    ASSERT_EQ(all[2].full, (Span{7, 9}));
}

// ============================================================================
// STEP BUDGET
// ============================================================================

TEST(bt_step_budget_throws_timeout) {
    auto e = bt("(a+)+\\1b", 200'000);
    std::string in(40, 'a');
    ASSERT_THROWS(e->match(in), FallbackTimeout);
    try {
        (void)e->match(in);
    } catch (const FallbackTimeout& t) {
        ASSERT_EQ(t.budget(), 200'000ULL);
        ASSERT_EQ(t.pattern(), "(a+)+\\1b");
    }
}

TEST(bt_budget_is_per_call) {
    auto e = bt("(a)\\1", 50);
    for (int i = 0; i < 100; ++i) ASSERT_TRUE(e->match("aa").has_value());
}

TEST(bt_explain_names_engine) {
    auto text = bt("(a)\\1")->explain();
    ASSERT_TRUE(text.find("fallback") != std::string::npos);
    ASSERT_TRUE(text.find("backref") != std::string::npos);
}

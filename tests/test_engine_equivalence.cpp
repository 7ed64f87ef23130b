#include "minitest.hpp"
#include "regex/Compiler.hpp"
#include <string>
#include <variant>
#include <vector>

using safere::regex::CompileOptions;
using safere::regex::MatchMode;
using safere::regex::ThompsonNFA;

// Patterns in the automaton subset and inputs that exercise them. Both
// engines run the same program, so every mode must agree exactly.
static const std::vector<std::string> kPatterns = {
    "a", "abc", "a|ab", "ab|a", "a*", "a+?", "a??b", "(a|b)*c", "(a|ab)(c|bcd)(d*)",
    "x*", "(x*)(y*)", "[0-9]+", "\\d{2,3}", "\\w+@\\w+\\.com", "(\\w+)=(\\w*)",
    "^a", "a$", "(?m)^\\w+$", "\\bis\\b", "\\B.", "(?i)straße", "(?s)a.b", "a.b",
    "(a)|(b)|(c)", "((a)|b)+", "(a+)(a+)", "(?:ab){2,4}", "(ab){3,}?", "a{0,2}a",
    "[^,]*", ",", "", "\xc3\xa9+", "[\xc3\xa0-\xc3\xbf]", "(?i)[a-f]+",
    "(a*)+", "(a|)+b", "(|a)*", "(?:a?){2,5}b",
    "a{2,3}?", "[ab]{3,}", "[ab]{3,}?c", "x*a{2,4}b", "(\\w{1,3}?)(c|d)", "(?:\\ba){1,3}",
    "(?:a\\b){1,3}", "\\w{2}\\b", "[^c]{0,3}c", "(a*)(a{2,3})",
};

static const std::vector<std::string> kInputs = {
    "", "a", "ab", "abc", "abcd", "aaab", "xaby", "bbbac", "abcbcd", "xxyy",
    "2024-01-02", "12 345 6789", "me@mail.com x@y.com", "key=value k2=",
    "line1\nline2\n", "this island is", "STRASSE Straße", "a\nb", "acb",
    "a,b,,c", "\xc3\xa9\xc3\xa9t\xc3\xa9", std::string("a\xff" "b", 3), "aaaaab",
    "ABCdef", "abababab", "b",
};

static std::unique_ptr<ThompsonNFA> automaton(const std::string& p, const CompileOptions& o) {
    auto r = safere::regex::compile(p, o);
    auto* e = std::get_if<std::unique_ptr<ThompsonNFA>>(&r);
    if (!e) throw ::mini::AssertionError("not an automaton pattern: " + p);
    return std::move(*e);
}

static void check_all(const CompileOptions& o) {
    const MatchMode modes[] = {MatchMode::FindFirst, MatchMode::FindAll,
                               MatchMode::AnchoredPrefix, MatchMode::AnchoredSuffix};
    for (const auto& p : kPatterns) {
        auto a = automaton(p, o);
        auto b = safere::regex::compile_fallback(p, o, 10'000'000);
        for (const auto& in : kInputs) {
            for (auto mode : modes) {
                if (a->run(in, mode) != b->run(in, mode))
                    throw ::mini::AssertionError("engines disagree on /" + p + "/ over \"" + in +
                                                 "\" in mode " + safere::regex::match_mode_name(mode));
            }
        }
    }
}

TEST(equivalence_default_options) {
    check_all(CompileOptions{});
}

TEST(equivalence_with_counter_loops) {
    CompileOptions o;
    o.replicate_limit = 0;
    check_all(o);
}

TEST(equivalence_full_match_helper) {
    auto a = automaton("(ab)+", CompileOptions{});
    ASSERT_TRUE(a->full_match("abab"));
    ASSERT_TRUE(!a->full_match("ababa"));
    auto b = safere::regex::compile_fallback("(ab)+", CompileOptions{}, 1000);
    ASSERT_EQ(b->run("abab", MatchMode::AnchoredPrefix).size(), 1u);
}

TEST(equivalence_engine_kinds) {
    auto a = automaton("a", CompileOptions{});
    ASSERT_TRUE(a->kind() == safere::regex::EngineKind::Automaton);
    auto b = safere::regex::compile_fallback("a", CompileOptions{}, 10);
    ASSERT_TRUE(b->kind() == safere::regex::EngineKind::Fallback);
    ASSERT_EQ(std::string(safere::regex::engine_kind_name(b->kind())), "fallback");
}

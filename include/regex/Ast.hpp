#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "regex/Errors.hpp"

namespace safere::regex {

struct CpRange { uint32_t lo, hi; };

// Sorted, merged code point ranges. Negation is kept as a flag and applied
// at match time.
struct CharClass {
    std::vector<CpRange> ranges;
    bool negated{false};

    void add(uint32_t lo, uint32_t hi) { ranges.push_back({lo, hi}); }
    void canonicalize();
    [[nodiscard]] bool contains(uint32_t cp) const;
    [[nodiscard]] bool matches(uint32_t cp) const { return contains(cp) != negated; }
};

enum class AssertKind : uint8_t {
    BeginLine,        // ^ under (?m)
    EndLine,          // $ under (?m)
    BeginText,        // ^ \A
    EndText,          // $ \z \Z
    WordBoundary,     // \b
    NotWordBoundary,  // \B
};

enum class NodeKind : uint8_t {
    Empty,
    Literal,     // cp, fold
    AnyChar,     // dotall
    Class,       // cls
    Assert,      // assertion
    Concat,      // children
    Alternate,   // children, in priority order
    Repeat,      // children[0], min, max, greedy, possessive
    Group,       // children[0], capture (0 = non-capturing), name
    Backref,     // capture, fold
    Look,        // children[0], behind, negated
    Atomic,      // children[0]
};

struct Node {
    NodeKind kind{NodeKind::Empty};
    size_t   offset{0};  // byte offset in the pattern

    uint32_t cp{0};
    bool     fold{false};
    bool     dotall{false};
    CharClass cls;
    AssertKind assertion{AssertKind::BeginText};

    int  min{0};
    int  max{-1};            // -1 = unbounded
    bool greedy{true};
    bool possessive{false};

    int  capture{0};
    std::string name;

    bool behind{false};
    bool negated{false};

    std::vector<std::unique_ptr<Node>> children;

    explicit Node(NodeKind k, size_t off = 0) : kind(k), offset(off) {}
};

using NodePtr = std::unique_ptr<Node>;

// Parsed pattern. `unsupported` is the first construct the automaton cannot
// express, if any; the tree is complete either way.
struct Regexp {
    std::string pattern;
    NodePtr root;
    int group_count{0};
    std::vector<std::pair<std::string, int>> names;
    std::optional<UnsupportedConstruct> unsupported;
};

// Dump the tree as an s-expression, for diagnostics and tests.
[[nodiscard]] std::string to_string(const Node& n);

} // namespace safere::regex

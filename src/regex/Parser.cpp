#include "regex/Parser.hpp"
#include "util/AsciiLower.hpp"
#include "util/Utf8.hpp"
#include <algorithm>
#include <cctype>

namespace safere::regex {

using safere::util::kMaxPseudoCp;

// ── CharClass ──────────────────────────────────────────────────────────

void CharClass::canonicalize() {
    std::sort(ranges.begin(), ranges.end(), [](const CpRange& a, const CpRange& b) { return a.lo < b.lo; });
    std::vector<CpRange> merged;
    for (auto& r : ranges) {
        if (!merged.empty() && r.lo <= merged.back().hi + 1)
            merged.back().hi = std::max(merged.back().hi, r.hi);
        else
            merged.push_back(r);
    }
    ranges = std::move(merged);
}

bool CharClass::contains(uint32_t cp) const {
    auto it = std::upper_bound(ranges.begin(), ranges.end(), cp,
                               [](uint32_t v, const CpRange& r) { return v < r.lo; });
    if (it == ranges.begin()) return false;
    --it;
    return cp <= it->hi;
}

// ── Helpers ────────────────────────────────────────────────────────────

namespace {

struct Flags {
    bool icase{false};
    bool multiline{false};
    bool dotall{false};
    bool verbose{false};
};

// Ranges of the \d \w \s classes; upper-case letters complement them.
void add_perl_class(char c, CharClass& cls) {
    CharClass base;
    switch (std::tolower((unsigned char)c)) {
        case 'd': base.add('0', '9'); break;
        case 'w': base.add('0', '9'); base.add('A', 'Z'); base.add('_', '_'); base.add('a', 'z'); break;
        case 's': base.add('\t', '\r'); base.add(' ', ' '); break;
        default: break;
    }
    if (std::islower((unsigned char)c)) {
        for (auto& r : base.ranges) cls.add(r.lo, r.hi);
        return;
    }
    uint32_t cursor = 0;
    for (auto& r : base.ranges) {
        if (r.lo > cursor) cls.add(cursor, r.lo - 1);
        cursor = r.hi + 1;
    }
    if (cursor <= kMaxPseudoCp) cls.add(cursor, kMaxPseudoCp);
}

// Add the other case of every foldable letter in the class ranges.
void fold_class(CharClass& cls) {
    std::vector<CpRange> extra;
    for (auto& r : cls.ranges) {
        if (r.lo > 0xFE) continue;
        uint32_t hi = std::min<uint32_t>(r.hi, 0xFE);
        for (uint32_t c = r.lo; c <= hi; ++c) {
            uint32_t o = safere::util::other_case(c);
            if (o != c) extra.push_back({o, o});
        }
    }
    cls.ranges.insert(cls.ranges.end(), extra.begin(), extra.end());
}

bool is_octal(char c) { return c >= '0' && c <= '7'; }

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_ident_start(char c) { return std::isalpha((unsigned char)c) || c == '_'; }
bool is_ident_char(char c)  { return std::isalnum((unsigned char)c) || c == '_'; }

class Parser {
public:
    Parser(std::string_view pattern, const ParseOptions& opts, Regexp& out)
        : pat_(pattern), opts_(opts), re_(out) {}

    NodePtr run() {
        Flags f;
        auto root = parse_alternation(f);
        if (p_ < pat_.size()) {
            // Only an unmatched ')' can stop the top-level alternation early.
            fail(p_, "unbalanced parenthesis");
        }
        return root;
    }

private:
    std::string_view pat_;
    size_t p_{0};
    const ParseOptions& opts_;
    Regexp& re_;
    std::vector<bool> closed_{false};  // closed_[g]: group g has been closed

    [[noreturn]] void fail(size_t at, const std::string& why) const {
        throw PatternSyntaxError(std::string(pat_), at, why);
    }

    void note_unsupported(const char* reason, size_t at) {
        if (!re_.unsupported) re_.unsupported = UnsupportedConstruct{reason, at};
    }

    [[nodiscard]] bool eof() const { return p_ >= pat_.size(); }
    [[nodiscard]] char peek(size_t ahead = 0) const {
        return p_ + ahead < pat_.size() ? pat_[p_ + ahead] : '\0';
    }

    void skip_verbose(const Flags& f) {
        if (!f.verbose) return;
        while (!eof()) {
            char c = peek();
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') { ++p_; continue; }
            if (c == '#') {
                while (!eof() && peek() != '\n') ++p_;
                continue;
            }
            break;
        }
    }

    // ── Alternation / concatenation ────────────────────────────────────

    NodePtr parse_alternation(Flags& f) {
        size_t start = p_;
        std::vector<NodePtr> branches;
        branches.push_back(parse_concat(f));
        while (!eof() && peek() == '|') {
            ++p_;
            branches.push_back(parse_concat(f));
        }
        if (branches.size() == 1) return std::move(branches[0]);
        auto n = std::make_unique<Node>(NodeKind::Alternate, start);
        n->children = std::move(branches);
        return n;
    }

    NodePtr parse_concat(Flags& f) {
        size_t start = p_;
        std::vector<NodePtr> items;
        for (;;) {
            skip_verbose(f);
            if (eof() || peek() == '|' || peek() == ')') break;
            size_t atom_at = p_;
            char c = peek();
            if (c == '*' || c == '+' || c == '?' || (c == '{' && bound_ahead())) fail(p_, "nothing to repeat");
            NodePtr atom = parse_atom(f);
            if (!atom) {
                // Flag group or comment: nothing may be repeated after it.
                skip_verbose(f);
                char q = peek();
                if (!eof() && (q == '*' || q == '+' || q == '?' || (q == '{' && bound_ahead())))
                    fail(p_, "nothing to repeat");
                continue;
            }
            atom = parse_quantifier(std::move(atom), f, atom_at);
            items.push_back(std::move(atom));
        }
        if (items.empty()) return std::make_unique<Node>(NodeKind::Empty, start);
        if (items.size() == 1) return std::move(items[0]);
        auto n = std::make_unique<Node>(NodeKind::Concat, start);
        n->children = std::move(items);
        return n;
    }

    // ── Quantifiers ────────────────────────────────────────────────────

    // True if a well-formed {m}, {m,}, {m,n} or {,n} starts at p_.
    [[nodiscard]] bool bound_ahead() const {
        size_t q = p_;
        if (q >= pat_.size() || pat_[q] != '{') return false;
        ++q;
        size_t d1 = q;
        while (q < pat_.size() && std::isdigit((unsigned char)pat_[q])) ++q;
        bool has_min = q > d1;
        if (q < pat_.size() && pat_[q] == '}') return has_min;
        if (q >= pat_.size() || pat_[q] != ',') return false;
        ++q;
        size_t d2 = q;
        while (q < pat_.size() && std::isdigit((unsigned char)pat_[q])) ++q;
        bool has_max = q > d2;
        if (!has_min && !has_max) return false;
        return q < pat_.size() && pat_[q] == '}';
    }

    int read_number(size_t at) {
        long v = 0;
        while (!eof() && std::isdigit((unsigned char)peek())) {
            v = v * 10 + (peek() - '0');
            if (v > opts_.max_repeat) fail(at, "repeat count too large");
            ++p_;
        }
        return (int)v;
    }

    NodePtr parse_quantifier(NodePtr atom, const Flags& f, size_t atom_at) {
        skip_verbose(f);
        if (eof()) return atom;
        size_t qstart = p_;
        int min = 0, max = -1;
        char c = peek();
        if (c == '*') { min = 0; max = -1; ++p_; }
        else if (c == '+') { min = 1; max = -1; ++p_; }
        else if (c == '?') { min = 0; max = 1; ++p_; }
        else if (c == '{' && bound_ahead()) {
            ++p_;
            if (peek() == ',') {
                min = 0;
            } else {
                min = read_number(qstart);
            }
            if (peek() == '}') {
                max = min;
            } else {
                ++p_;  // ','
                max = std::isdigit((unsigned char)peek()) ? read_number(qstart) : -1;
            }
            ++p_;  // '}'
            if (max >= 0 && min > max) fail(qstart, "min repeat greater than max repeat");
        } else {
            return atom;
        }

        if (atom->kind == NodeKind::Assert) fail(qstart, "nothing to repeat");

        auto rep = std::make_unique<Node>(NodeKind::Repeat, atom_at);
        rep->min = min;
        rep->max = max;
        if (peek() == '?') { rep->greedy = false; ++p_; }
        else if (peek() == '+') {
            rep->possessive = true;
            note_unsupported("possessive quantifier", qstart);
            ++p_;
        }
        rep->children.push_back(std::move(atom));

        skip_verbose(f);
        char n = peek();
        if (!eof() && (n == '*' || n == '+' || n == '?' || (n == '{' && bound_ahead())))
            fail(p_, "multiple repeat");
        return rep;
    }

    // ── Atoms ──────────────────────────────────────────────────────────

    NodePtr make_literal(uint32_t cp, const Flags& f, size_t at) {
        auto n = std::make_unique<Node>(NodeKind::Literal, at);
        n->cp = cp;
        n->fold = f.icase && safere::util::other_case(cp) != cp;
        return n;
    }

    NodePtr parse_atom(Flags& f) {
        size_t at = p_;
        char c = peek();
        switch (c) {
            case '(':
                return parse_group(f);
            case '[':
                return parse_class(f);
            case '.': {
                ++p_;
                auto n = std::make_unique<Node>(NodeKind::AnyChar, at);
                n->dotall = f.dotall;
                return n;
            }
            case '^': {
                ++p_;
                auto n = std::make_unique<Node>(NodeKind::Assert, at);
                n->assertion = f.multiline ? AssertKind::BeginLine : AssertKind::BeginText;
                return n;
            }
            case '$': {
                ++p_;
                auto n = std::make_unique<Node>(NodeKind::Assert, at);
                n->assertion = f.multiline ? AssertKind::EndLine : AssertKind::EndText;
                return n;
            }
            case '\\':
                return parse_escape(f);
            default:
                break;
        }
        uint32_t cp;
        int len = safere::util::decode_strict(pat_, p_, &cp);
        if (len == 0) fail(p_, "invalid UTF-8 in pattern");
        p_ += (size_t)len;
        return make_literal(cp, f, at);
    }

    // ── Groups ─────────────────────────────────────────────────────────

    std::string read_name(char terminator) {
        size_t at = p_;
        std::string name;
        while (!eof() && peek() != terminator) name.push_back(pat_[p_++]);
        if (eof()) fail(at, "missing group name terminator");
        ++p_;
        if (name.empty() || !is_ident_start(name[0]) ||
            !std::all_of(name.begin(), name.end(), is_ident_char))
            fail(at, "bad group name '" + name + "'");
        return name;
    }

    void expect_close(size_t open_at) {
        if (eof() || peek() != ')') fail(open_at, "missing ), unterminated subpattern");
        ++p_;
    }

    NodePtr capture_group(Flags& f, size_t at, std::string name) {
        int idx = ++re_.group_count;
        closed_.push_back(false);
        if (!name.empty()) {
            for (auto& [n, i] : re_.names)
                if (n == name) fail(at, "redefinition of group name '" + name + "'");
            re_.names.emplace_back(name, idx);
        }
        Flags inner = f;
        auto body = parse_alternation(inner);
        expect_close(at);
        closed_[(size_t)idx] = true;
        auto g = std::make_unique<Node>(NodeKind::Group, at);
        g->capture = idx;
        g->name = std::move(name);
        g->children.push_back(std::move(body));
        return g;
    }

    NodePtr wrap(NodeKind kind, Flags& f, size_t at) {
        Flags inner = f;
        auto body = parse_alternation(inner);
        expect_close(at);
        auto n = std::make_unique<Node>(kind, at);
        n->children.push_back(std::move(body));
        return n;
    }

    NodePtr look(Flags& f, size_t at, bool behind, bool negated) {
        note_unsupported(behind ? "lookbehind assertion" : "lookahead assertion", at);
        auto n = wrap(NodeKind::Look, f, at);
        n->behind = behind;
        n->negated = negated;
        return n;
    }

    NodePtr backref(int idx, const Flags& f, size_t at) {
        if (idx <= 0 || idx > re_.group_count) fail(at, "invalid group reference " + std::to_string(idx));
        if (!closed_[(size_t)idx]) fail(at, "cannot refer to an open group");
        note_unsupported("backreference", at);
        auto n = std::make_unique<Node>(NodeKind::Backref, at);
        n->capture = idx;
        n->fold = f.icase;
        return n;
    }

    NodePtr parse_group(Flags& f) {
        size_t at = p_;
        ++p_;  // '('
        if (peek() != '?') return capture_group(f, at, {});
        ++p_;  // '?'
        char c = peek();
        switch (c) {
            case ':':
                ++p_;
                return wrap(NodeKind::Group, f, at);
            case '=':
            case '!':
                ++p_;
                return look(f, at, false, c == '!');
            case '>':
                ++p_;
                note_unsupported("atomic group", at);
                return wrap(NodeKind::Atomic, f, at);
            case '#':
                while (!eof() && peek() != ')') ++p_;
                expect_close(at);
                return nullptr;
            case '<':
                ++p_;
                if (peek() == '=' || peek() == '!') {
                    bool neg = peek() == '!';
                    ++p_;
                    return look(f, at, true, neg);
                }
                return capture_group(f, at, read_name('>'));
            case 'P':
                ++p_;
                if (peek() == '<') {
                    ++p_;
                    return capture_group(f, at, read_name('>'));
                }
                if (peek() == '=') {
                    ++p_;
                    std::string name = read_name(')');
                    for (auto& [n, i] : re_.names)
                        if (n == name) return backref(i, f, at);
                    fail(at, "unknown group name '" + name + "'");
                }
                fail(at, "unknown extension ?P" + std::string(1, peek()));
            default:
                break;
        }
        return parse_flag_group(f, at);
    }

    // (?imsx-imsx) applies to the rest of the enclosing group;
    // (?imsx-imsx:...) applies to the subpattern only.
    NodePtr parse_flag_group(Flags& f, size_t at) {
        Flags nf = f;
        bool negate = false;
        bool any = false;
        while (!eof()) {
            char c = peek();
            if (c == ')' || c == ':') break;
            if (c == '-') {
                if (negate) fail(p_, "bad inline flag");
                negate = true;
            } else {
                bool v = !negate;
                switch (c) {
                    case 'i': nf.icase = v; break;
                    case 'm': nf.multiline = v; break;
                    case 's': nf.dotall = v; break;
                    case 'x': nf.verbose = v; break;
                    default: fail(p_, "unknown extension ?" + std::string(1, c));
                }
                any = true;
            }
            ++p_;
        }
        if (eof()) fail(at, "missing ), unterminated subpattern");
        if (!any && !negate) fail(at, "unknown extension");
        if (negate && !any) fail(at, "missing flag");
        if (peek() == ')') {
            ++p_;
            f = nf;
            return nullptr;
        }
        ++p_;  // ':'
        auto body = parse_alternation(nf);
        expect_close(at);
        auto n = std::make_unique<Node>(NodeKind::Group, at);
        n->children.push_back(std::move(body));
        return n;
    }

    // ── Escapes ────────────────────────────────────────────────────────

    uint32_t read_hex(size_t digits, size_t at) {
        uint32_t v = 0;
        for (size_t i = 0; i < digits; ++i) {
            int h = hex_value(peek());
            if (eof() || h < 0) fail(at, "incomplete escape");
            v = v * 16 + (uint32_t)h;
            ++p_;
        }
        return v;
    }

    // Character escapes shared by atoms and classes. p_ is just past the
    // escaped character c.
    uint32_t char_escape(char c, size_t at) {
        switch (c) {
            case 'a': return 0x07;
            case 'f': return 0x0C;
            case 'n': return '\n';
            case 'r': return '\r';
            case 't': return '\t';
            case 'v': return 0x0B;
            case '0': {
                uint32_t v = 0;
                for (int i = 0; i < 2 && is_octal(peek()); ++i) v = v * 8 + (uint32_t)(pat_[p_++] - '0');
                return v;
            }
            case 'x': {
                if (peek() == '{') {
                    ++p_;
                    uint32_t v = 0;
                    size_t n = 0;
                    while (!eof() && peek() != '}') {
                        int h = hex_value(peek());
                        if (h < 0) fail(at, "bad escape \\x{");
                        v = v * 16 + (uint32_t)h;
                        if (v > safere::util::kMaxCodepoint) fail(at, "escape value out of range");
                        ++p_;
                        ++n;
                    }
                    if (eof() || n == 0) fail(at, "bad escape \\x{");
                    ++p_;
                    return v;
                }
                return read_hex(2, at);
            }
            case 'u':
                return read_hex(4, at);
            case 'U': {
                uint32_t v = read_hex(8, at);
                if (v > safere::util::kMaxCodepoint) fail(at, "escape value out of range");
                return v;
            }
            default:
                break;
        }
        if (std::isalnum((unsigned char)c)) fail(at, std::string("bad escape \\") + c);
        // Escaped punctuation or a non-ASCII character stands for itself.
        uint32_t cp;
        int len = safere::util::decode_strict(pat_, p_ - 1, &cp);
        if (len == 0) fail(at, "invalid UTF-8 in pattern");
        p_ += (size_t)len - 1;
        return cp;
    }

    NodePtr parse_escape(const Flags& f) {
        size_t at = p_;
        if (p_ + 1 >= pat_.size()) fail(at, "bad escape (end of pattern)");
        char c = pat_[p_ + 1];
        p_ += 2;
        switch (c) {
            case 'd': case 'D': case 'w': case 'W': case 's': case 'S': {
                auto n = std::make_unique<Node>(NodeKind::Class, at);
                add_perl_class(c, n->cls);
                n->cls.canonicalize();
                return n;
            }
            case 'b': case 'B': case 'A': case 'z': case 'Z': {
                auto n = std::make_unique<Node>(NodeKind::Assert, at);
                n->assertion = c == 'b' ? AssertKind::WordBoundary
                             : c == 'B' ? AssertKind::NotWordBoundary
                             : c == 'A' ? AssertKind::BeginText
                                        : AssertKind::EndText;
                return n;
            }
            default:
                break;
        }
        if (c >= '1' && c <= '9') {
            // Three octal digits form an octal escape; otherwise one or two
            // digits name a group.
            if (is_octal(c) && is_octal(peek()) && is_octal(peek(1))) {
                uint32_t v = (uint32_t)(c - '0') * 64 + (uint32_t)(peek() - '0') * 8 + (uint32_t)(peek(1) - '0');
                if (v > 0377) fail(at, "octal escape value outside of range 0-0o377");
                p_ += 2;
                return make_literal(v, f, at);
            }
            int idx = c - '0';
            if (std::isdigit((unsigned char)peek())) idx = idx * 10 + (pat_[p_++] - '0');
            return backref(idx, f, at);
        }
        return make_literal(char_escape(c, at), f, at);
    }

    // ── Character classes ──────────────────────────────────────────────

    // One class member. Returns false when it was a \d-style class escape
    // (already added to cls), true with *cp set for a single character.
    bool class_item(CharClass& cls, uint32_t* cp) {
        size_t at = p_;
        if (peek() == '\\') {
            if (p_ + 1 >= pat_.size()) fail(at, "unterminated character set");
            char c = pat_[p_ + 1];
            p_ += 2;
            switch (c) {
                case 'd': case 'D': case 'w': case 'W': case 's': case 'S':
                    add_perl_class(c, cls);
                    return false;
                case 'b':
                    *cp = 0x08;
                    return true;
                default:
                    break;
            }
            if (c >= '1' && c <= '7' && is_octal(peek()) && is_octal(peek(1))) {
                *cp = (uint32_t)(c - '0') * 64 + (uint32_t)(peek() - '0') * 8 + (uint32_t)(peek(1) - '0');
                p_ += 2;
                return true;
            }
            if (c >= '1' && c <= '9') fail(at, std::string("bad escape \\") + c);
            *cp = char_escape(c, at);
            return true;
        }
        int len = safere::util::decode_strict(pat_, p_, cp);
        if (len == 0) fail(at, "invalid UTF-8 in pattern");
        p_ += (size_t)len;
        return true;
    }

    NodePtr parse_class(const Flags& f) {
        size_t at = p_;
        ++p_;  // '['
        auto n = std::make_unique<Node>(NodeKind::Class, at);
        if (peek() == '^') { n->cls.negated = true; ++p_; }
        bool first = true;
        while (!eof() && (peek() != ']' || first)) {
            first = false;
            size_t item_at = p_;
            uint32_t lo;
            if (!class_item(n->cls, &lo)) {
                if (peek() == '-' && peek(1) != ']' && p_ + 1 < pat_.size())
                    fail(item_at, "bad character range");
                continue;
            }
            if (peek() == '-' && p_ + 1 < pat_.size() && peek(1) != ']') {
                ++p_;  // '-'
                uint32_t hi;
                if (!class_item(n->cls, &hi)) fail(item_at, "bad character range");
                if (hi < lo) fail(item_at, "bad character range");
                n->cls.add(lo, hi);
            } else {
                n->cls.add(lo, lo);
            }
        }
        if (eof()) fail(at, "unterminated character set");
        ++p_;  // ']'
        if (f.icase) fold_class(n->cls);
        n->cls.canonicalize();
        return n;
    }
};

void dump(const Node& n, std::string& out) {
    auto kids = [&] {
        for (auto& c : n.children) { out += ' '; dump(*c, out); }
    };
    switch (n.kind) {
        case NodeKind::Empty: out += "(empty)"; return;
        case NodeKind::Literal:
            out += "(lit ";
            safere::util::append_utf8(out, n.cp);
            if (n.fold) out += " /i";
            out += ')';
            return;
        case NodeKind::AnyChar: out += n.dotall ? "(any /s)" : "(any)"; return;
        case NodeKind::Class:
            out += n.cls.negated ? "(class ^" : "(class ";
            for (size_t i = 0; i < n.cls.ranges.size(); ++i) {
                if (i > 0) out += ' ';
                out += std::to_string(n.cls.ranges[i].lo) + "-" + std::to_string(n.cls.ranges[i].hi);
            }
            out += ')';
            return;
        case NodeKind::Assert: {
            static const char* names[] = {"bol", "eol", "bot", "eot", "wb", "nwb"};
            out += "(assert ";
            out += names[(int)n.assertion];
            out += ')';
            return;
        }
        case NodeKind::Concat: out += "(cat"; kids(); out += ')'; return;
        case NodeKind::Alternate: out += "(alt"; kids(); out += ')'; return;
        case NodeKind::Repeat:
            out += "(rep " + std::to_string(n.min) + " " + std::to_string(n.max);
            if (!n.greedy) out += " lazy";
            if (n.possessive) out += " possessive";
            kids();
            out += ')';
            return;
        case NodeKind::Group:
            out += n.capture ? "(cap " + std::to_string(n.capture) : std::string("(group");
            kids();
            out += ')';
            return;
        case NodeKind::Backref: out += "(backref " + std::to_string(n.capture) + ")"; return;
        case NodeKind::Look:
            out += n.behind ? "(behind" : "(ahead";
            if (n.negated) out += " not";
            kids();
            out += ')';
            return;
        case NodeKind::Atomic: out += "(atomic"; kids(); out += ')'; return;
    }
}

} // namespace

Regexp parse(std::string_view pattern, const ParseOptions& opts) {
    Regexp re;
    re.pattern = std::string(pattern);
    Parser parser(pattern, opts, re);
    re.root = parser.run();
    return re;
}

std::string to_string(const Node& n) {
    std::string out;
    dump(n, out);
    return out;
}

} // namespace safere::regex

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace safere::regex {

// Base of every failure surfaced to callers of the matching layer.
struct Error : public std::runtime_error { using std::runtime_error::runtime_error; };

// The pattern is not valid under the shared dialect; neither engine can run it.
class PatternSyntaxError : public Error {
public:
    PatternSyntaxError(std::string pattern, size_t offset, std::string reason);

    [[nodiscard]] const std::string& pattern() const { return pattern_; }
    [[nodiscard]] size_t offset() const { return offset_; }
    [[nodiscard]] const std::string& reason() const { return reason_; }

private:
    std::string pattern_;
    size_t offset_;
    std::string reason_;
};

// The fallback engine used up its step budget on one call.
class FallbackTimeout : public Error {
public:
    FallbackTimeout(std::string pattern, unsigned long long budget);

    [[nodiscard]] const std::string& pattern() const { return pattern_; }
    [[nodiscard]] unsigned long long budget() const { return budget_; }

private:
    std::string pattern_;
    unsigned long long budget_;
};

// A valid pattern the automaton cannot express. Not an error: a value the
// selector inspects to route the pattern to the backtracking engine.
struct UnsupportedConstruct {
    std::string reason;   // e.g. "backreference"
    size_t offset{0};     // byte offset in the pattern
};

} // namespace safere::regex

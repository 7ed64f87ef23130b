#pragma once

#include <memory>
#include <string_view>
#include <variant>
#include "regex/Backtracker.hpp"
#include "regex/Errors.hpp"
#include "regex/Program.hpp"
#include "regex/ThompsonNFA.hpp"

namespace safere::regex {

using CompileResult = std::variant<std::unique_ptr<ThompsonNFA>, UnsupportedConstruct>;

// Compile pattern text for the linear-time engine. A valid pattern the
// automaton cannot express comes back as UnsupportedConstruct; text that is
// not a pattern at all throws PatternSyntaxError.
[[nodiscard]] CompileResult compile(std::string_view pattern, const CompileOptions& opts = {});

// Compile pattern text for the backtracking engine. Accepts the whole
// dialect. Throws PatternSyntaxError, including for a program that does not
// fit max_program_size.
[[nodiscard]] std::unique_ptr<Backtracker> compile_fallback(std::string_view pattern, const CompileOptions& opts,
                                                            unsigned long long step_budget);

} // namespace safere::regex

#pragma once

#include <string_view>
#include "regex/Ast.hpp"

namespace safere::regex {

struct ParseOptions {
    int max_repeat{65535};   // largest accepted {m,n} bound
};

// Parse pattern text into a Regexp. Throws PatternSyntaxError.
// Recursive descent: alternation > concatenation > repetition > atom.
[[nodiscard]] Regexp parse(std::string_view pattern, const ParseOptions& opts = {});

} // namespace safere::regex

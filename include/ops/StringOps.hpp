#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "regex/Engine.hpp"
#include "regex/EngineSelector.hpp"

namespace safere::ops {

// Selector built from app::config() on first use, shared process-wide.
regex::EngineSelector& default_selector();

// Pattern text that matches `literal` exactly: every ASCII character other
// than letters, digits and '_' is backslash-escaped.
[[nodiscard]] std::string escape(std::string_view literal);

// Pieces of s between matches of the pattern, each followed by the text of
// the match's capture groups (empty for a group that did not take part).
// limit <= 0: split at every match. limit > 0: at most limit - 1 splits,
// the last piece keeps the rest of s.
[[nodiscard]] std::vector<std::string> split(std::string_view s, const regex::CompiledEngine& re, long limit = -1);

// Every non-overlapping match replaced by `replacement`, taken literally.
[[nodiscard]] std::string regexp_replace(std::string_view s, const regex::CompiledEngine& re,
                                         std::string_view replacement);

// Text of group idx of the first match (0 = whole match); empty string when
// nothing matches, the group did not take part, or idx is out of range.
[[nodiscard]] std::string regexp_extract(std::string_view s, const regex::CompiledEngine& re, long idx);

// True when the pattern matches anywhere in s.
[[nodiscard]] bool rlike(std::string_view s, const regex::CompiledEngine& re);

// Pattern-text forms. Patterns go through `sel`; the literal forms escape
// their argument and anchor it at the start / end of s.
[[nodiscard]] std::vector<std::string> split(std::string_view s, std::string_view pattern, long limit = -1,
                                             regex::EngineSelector& sel = default_selector());
[[nodiscard]] std::string regexp_replace(std::string_view s, std::string_view pattern, std::string_view replacement,
                                         regex::EngineSelector& sel = default_selector());
[[nodiscard]] std::string regexp_extract(std::string_view s, std::string_view pattern, long idx,
                                         regex::EngineSelector& sel = default_selector());
[[nodiscard]] bool rlike(std::string_view s, std::string_view pattern,
                         regex::EngineSelector& sel = default_selector());
[[nodiscard]] bool startswith(std::string_view s, std::string_view literal,
                              regex::EngineSelector& sel = default_selector());
[[nodiscard]] bool endswith(std::string_view s, std::string_view literal,
                            regex::EngineSelector& sel = default_selector());

} // namespace safere::ops

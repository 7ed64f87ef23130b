#include "regex/Errors.hpp"
#include "regex/Match.hpp"

namespace safere::regex {

PatternSyntaxError::PatternSyntaxError(std::string pattern, size_t offset, std::string reason)
    : Error("invalid pattern '" + pattern + "' at offset " + std::to_string(offset) + ": " + reason),
      pattern_(std::move(pattern)), offset_(offset), reason_(std::move(reason)) {}

FallbackTimeout::FallbackTimeout(std::string pattern, unsigned long long budget)
    : Error("backtracking step budget of " + std::to_string(budget) + " exceeded for pattern '" + pattern + "'"),
      pattern_(std::move(pattern)), budget_(budget) {}

const char* match_mode_name(MatchMode m) {
    switch (m) {
        case MatchMode::FindFirst:      return "find_first";
        case MatchMode::FindAll:        return "find_all";
        case MatchMode::AnchoredPrefix: return "anchored_prefix";
        case MatchMode::AnchoredSuffix: return "anchored_suffix";
    }
    return "unknown";
}

} // namespace safere::regex

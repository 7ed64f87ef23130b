#include "regex/Compiler.hpp"
#include "regex/Parser.hpp"
#include <string>

namespace safere::regex {

namespace {

Regexp parse_for(std::string_view pattern, const CompileOptions& opts) {
    ParseOptions po;
    po.max_repeat = opts.max_repeat;
    return parse(pattern, po);
}

} // namespace

CompileResult compile(std::string_view pattern, const CompileOptions& opts) {
    Regexp re = parse_for(pattern, opts);
    if (re.unsupported) return *re.unsupported;

    Program prog;
    UnsupportedConstruct why;
    if (!build_program(re, opts, ProgramTarget::Automaton, prog, why)) return why;
    return std::make_unique<ThompsonNFA>(std::string(pattern), std::move(prog), std::move(re.names));
}

std::unique_ptr<Backtracker> compile_fallback(std::string_view pattern, const CompileOptions& opts,
                                              unsigned long long step_budget) {
    Regexp re = parse_for(pattern, opts);

    Program prog;
    UnsupportedConstruct why;
    if (!build_program(re, opts, ProgramTarget::Backtrack, prog, why))
        throw PatternSyntaxError(std::string(pattern), why.offset, "pattern too large (" + why.reason + ")");
    return std::make_unique<Backtracker>(std::string(pattern), std::move(prog), std::move(re.names), step_budget);
}

} // namespace safere::regex

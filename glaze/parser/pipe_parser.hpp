// pipe_parser.hpp - `expr |> f(...) |> g` output filter chains

#ifndef GLAZE_PIPE_PARSER_HPP
#define GLAZE_PIPE_PARSER_HPP

#include <string>
#include <vector>

namespace glaze {

struct PipeChain {
    std::string expression;             // base expression, trimmed
    std::vector<std::string> pipes;     // filter stages in application order
    bool raw = false;                   // raw() marker: escape off
    bool json = false;                  // json() marker: structured encoder
    bool url = false;                   // url() marker: URL component encoder
};

// Splits on `|>` and strips the raw()/json()/url() markers from the chain.
// An expression without `|>` comes back unchanged with no stages.
PipeChain parse_pipes(const std::string& expression);

// Applies stages in order: a stage containing `...` has it replaced by the
// running expression, any other stage is called as `(stage)(running)`.
std::string compile_pipes(const std::string& base, const std::vector<std::string>& pipes);

} // namespace glaze

#endif // GLAZE_PIPE_PARSER_HPP

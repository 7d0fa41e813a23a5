// builtin.hpp - helpers shared by the built-in directive compilers

#ifndef GLAZE_DIRECTIVE_BUILTIN_HPP
#define GLAZE_DIRECTIVE_BUILTIN_HPP

#include <stdint.h>
#include <string>
#include <vector>

#include "directive.hpp"
#include "../pipeline/context.hpp"

namespace glaze {

// RAW_CODE node positioned at `origin`
NodeId raw_code_at(CompilationContext& ctx, const std::string& code, NodeId origin);

void append_nodes(std::vector<NodeId>* out, const std::vector<NodeId>& nodes);

// Wrapper mode for loops: the directive holds exactly one element, and that
// element holds at least one element and no literal text or output of its
// own. The element is then emitted once and its children repeat.
bool use_wrapper_mode(const NodeStore& store, NodeId directive);

// "$__<kind>_<hash>" from the expression and the position of `origin`
std::string unique_variable(const char* kind, const std::string& expression,
                            const NodeStore& store, NodeId origin);

// "<prefix>:<name>" as the template author wrote it
std::string directive_label(const CompilationContext& ctx, const std::string& name);

DirectiveDef make_directive(const char* name, DirectiveType type, DirectiveCompileFn compile,
                            const char* description);

} // namespace glaze

#endif // GLAZE_DIRECTIVE_BUILTIN_HPP

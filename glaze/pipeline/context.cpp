#include "context.hpp"

namespace glaze {

bool CompilationContext::fail(GlazeErrorCode code, const std::string& message, uint32_t line,
                              uint32_t column, const std::string& suggestion) {
    if (failed()) return false;
    error.code = code;
    error.message = message;
    error.location.file = template_path;
    error.location.line = line;
    error.location.column = column;
    error.suggestion = suggestion;
    if (source && line > 0) {
        error.snippet = err_snippet(*source, line, column);
    }
    return false;
}

bool CompilationContext::fail_at(GlazeErrorCode code, const std::string& message, NodeId node) {
    if (!store.valid(node)) return fail(code, message, 0, 0);
    const Node& n = store.get(node);
    return fail(code, message, n.line, n.column);
}

} // namespace glaze

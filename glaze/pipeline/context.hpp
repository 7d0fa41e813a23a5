// context.hpp - per-compile state threaded through every stage

#ifndef GLAZE_PIPELINE_CONTEXT_HPP
#define GLAZE_PIPELINE_CONTEXT_HPP

#include <stdint.h>
#include <string>

#include "../config.hpp"
#include "../glaze_error.h"
#include "../loader.hpp"
#include "../ast/node.hpp"

namespace glaze {

class DirectiveRegistry;

// Created fresh for each compile and never shared between compiles.
// Only the first recorded error is kept; later stages see failed() and
// unwind without producing output.
struct CompilationContext {
    std::string template_path;                  // empty for inline sources
    const std::string* source = nullptr;
    bool debug = false;
    const Config* config = nullptr;
    const DirectiveRegistry* registry = nullptr;
    DependencySink* sink = nullptr;             // optional
    NodeStore store;
    CompileError error;

    bool failed() const { return !error.ok(); }

    // records the error (first one wins) and returns false
    bool fail(GlazeErrorCode code, const std::string& message, uint32_t line, uint32_t column,
              const std::string& suggestion = "");
    bool fail_at(GlazeErrorCode code, const std::string& message, NodeId node);

    void add_dependency(const std::string& path) {
        if (sink) sink->add_dependency(path);
    }
    void add_component(const std::string& path) {
        if (sink) sink->add_component(path);
    }
};

} // namespace glaze

#endif // GLAZE_PIPELINE_CONTEXT_HPP

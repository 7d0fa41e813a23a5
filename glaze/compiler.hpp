/**
 * @file compiler.hpp
 * @brief Template source -> PHP source, the public entry point of glaze
 *
 *   lexer -> parser -> pipeline (routing, extraction, pairing,
 *   compilation, context analysis, custom passes) -> code generator
 *
 * A Compiler owns its configuration, directive registry and pass list.
 * Each compile() builds a fresh CompilationContext, so one Compiler may
 * compile many templates; concurrent compiles need separate instances.
 */

#ifndef GLAZE_COMPILER_HPP
#define GLAZE_COMPILER_HPP

#include <memory>
#include <string>

#include "config.hpp"
#include "glaze_error.h"
#include "loader.hpp"
#include "directive/registry.hpp"
#include "pipeline/pipeline.hpp"

namespace glaze {

struct CompileResult {
    bool ok = false;
    std::string code;       // generated PHP, empty on failure
    CompileError error;     // set when !ok
};

class Compiler {
public:
    Compiler();
    explicit Compiler(const Config& config);

    const Config& config() const { return config_; }
    DirectiveRegistry& registry() { return registry_; }
    const DirectiveRegistry& registry() const { return registry_; }

    // custom passes run alongside the default ones, ordered by priority
    void add_pass(std::unique_ptr<AstPass> pass, int priority);
    Pipeline& pipeline() { return pipeline_; }

    // `path` is used for diagnostics and the debug header only
    CompileResult compile(const std::string& source, const std::string& path = "",
                          bool debug = false, DependencySink* sink = nullptr);

    // resolves and loads `path` through `loader`, reports it to `sink`
    CompileResult compile_template(const std::string& path, const TemplateLoader& loader,
                                   DependencySink* sink = nullptr, bool debug = false);

private:
    void init();

    Config config_;
    DirectiveRegistry registry_;
    Pipeline pipeline_;
};

} // namespace glaze

#endif // GLAZE_COMPILER_HPP

#include "compiler.hpp"
#include "codegen/code_generator.hpp"
#include "parser/lexer.hpp"
#include "parser/parser.hpp"
#include "pass/passes.hpp"
#include "../lib/log.h"

namespace glaze {

Compiler::Compiler() {
    init();
}

Compiler::Compiler(const Config& config) : config_(config) {
    init();
}

void Compiler::init() {
    registry_ = DirectiveRegistry::with_defaults();
    // renamed slot/bind markers are accepted as pass-through names
    const std::string* markers[] = {&config_.slot_attribute, &config_.bind_attribute};
    for (const std::string* marker : markers) {
        if (marker->empty() || registry_.has(*marker)) continue;
        DirectiveDef def;
        def.name = *marker;
        def.type = DirectiveType::PASS_THROUGH;
        def.description = "handled outside the directive passes";
        registry_.define(def);
    }

    pipeline_.add_pass(std::unique_ptr<AstPass>(new ElementRoutingPass()), ELEMENT_ROUTING_PRIORITY);
    pipeline_.add_pass(std::unique_ptr<AstPass>(new DirectiveExtractionPass()), DIRECTIVE_EXTRACTION_PRIORITY);
    pipeline_.add_pass(std::unique_ptr<AstPass>(new DirectivePairingPass()), DIRECTIVE_PAIRING_PRIORITY);
    pipeline_.add_pass(std::unique_ptr<AstPass>(new DirectiveCompilationPass()), DIRECTIVE_COMPILATION_PRIORITY);
    pipeline_.add_pass(std::unique_ptr<AstPass>(new ContextAnalysisPass()), CONTEXT_ANALYSIS_PRIORITY);
}

void Compiler::add_pass(std::unique_ptr<AstPass> pass, int priority) {
    pipeline_.add_pass(std::move(pass), priority);
}

static void log_failure(const CompileError& error) {
    log_error("glaze: %s [%d %s] at %s:%u:%u", error.message.c_str(), (int)error.code,
              err_code_name(error.code),
              error.location.file.empty() ? "inline" : error.location.file.c_str(),
              error.location.line, error.location.column);
}

CompileResult Compiler::compile(const std::string& source, const std::string& path, bool debug,
                                DependencySink* sink) {
    CompileResult result;
    CompilationContext ctx;
    ctx.template_path = path;
    ctx.source = &source;
    ctx.debug = debug;
    ctx.config = &config_;
    ctx.registry = &registry_;
    ctx.sink = sink;

    Lexer lexer(config_);
    std::vector<Token> tokens = lexer.tokenize(source);
    log_debug("glaze lex: %zu tokens from %s", tokens.size(), path.empty() ? "inline" : path.c_str());
    TokenStream stream(std::move(tokens));

    Parser parser(config_);
    NodeId document = parser.parse(stream, ctx);
    if (document != NO_NODE) document = pipeline_.execute(document, ctx);
    if (document != NO_NODE) {
        CodeGenerator generator(ctx);
        result.ok = generator.generate(document, &result.code);
    }

    if (!result.ok) {
        if (!ctx.failed()) {
            ctx.fail(ERR_INVALID_STATE, "Compilation stopped without a diagnostic", 0, 0);
        }
        result.code.clear();
        result.error = ctx.error;
        log_failure(result.error);
    }
    return result;
}

CompileResult Compiler::compile_template(const std::string& path, const TemplateLoader& loader,
                                         DependencySink* sink, bool debug) {
    std::string resolved = loader.resolve(path, "");
    std::string source;
    CompileResult result;
    if (!loader.load(resolved, &source, &result.error)) {
        if (result.error.ok()) result.error.code = ERR_FILE_READ_ERROR;
        if (result.error.location.file.empty()) result.error.location.file = resolved;
        log_failure(result.error);
        return result;
    }
    if (sink) sink->add_dependency(resolved);
    return compile(source, resolved, debug, sink);
}

} // namespace glaze

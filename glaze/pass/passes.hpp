/**
 * @file passes.hpp
 * @brief The default AST passes and their priorities
 *
 *   15  element-routing       <s-ifblock name="x"> -> <s-template s:ifblock="x">
 *   20  directive-extraction  s:name attributes -> DIRECTIVE nodes
 *   30  directive-pairing     if/elseif/else, forelse/empty, try/finally links
 *   40  directive-compilation DIRECTIVE -> generated code and elements
 *   60  context-analysis      output context for every escaped expression
 *
 * Passes keep no per-compile state; configuration and the directive
 * registry come from the CompilationContext.
 */

#ifndef GLAZE_PASSES_HPP
#define GLAZE_PASSES_HPP

#include <string>
#include <vector>

#include "../pipeline/pipeline.hpp"

namespace glaze {

struct DirectiveDef;

static const int ELEMENT_ROUTING_PRIORITY = 15;
static const int DIRECTIVE_EXTRACTION_PRIORITY = 20;
static const int DIRECTIVE_PAIRING_PRIORITY = 30;
static const int DIRECTIVE_COMPILATION_PRIORITY = 40;
static const int CONTEXT_ANALYSIS_PRIORITY = 60;

// ============================================================================
// Element routing
// ============================================================================

// A component named after an element-claiming directive becomes a fragment
// carrying that directive. Children are routed from the parent's before()
// hook so that pairing sees the routed directives.
class ElementRoutingPass : public AstPass {
public:
    const char* name() const override { return "element-routing"; }
    NodeAction before(NodeId node, PipelineContext& context) override;

private:
    // fragment replacing `component`, or `component` itself; NO_NODE on error
    NodeId route(NodeId component, CompilationContext& ctx);
};

// ============================================================================
// Directive extraction
// ============================================================================

class DirectiveExtractionPass : public AstPass {
public:
    const char* name() const override { return "directive-extraction"; }
    NodeAction before(NodeId node, PipelineContext& context) override;

private:
    struct Found {
        std::string name;
        std::string expression;
        const DirectiveDef* def = nullptr;
        uint32_t line = 0;      // of the attribute
        uint32_t column = 0;

        bool found() const { return def != nullptr; }
    };

    struct Extracted {
        Found control;
        Found content;
        std::vector<Found> custom;
        std::vector<AttributeNode> remaining;
        bool keep_wrapper = true;
        Found modifier;
    };

    bool needs_extraction(const Node& node, CompilationContext& ctx) const;
    // replacement for `node`, or `node` itself; NO_NODE on error
    NodeId transform(NodeId node, CompilationContext& ctx);

    bool extract(NodeId node, CompilationContext& ctx, Extracted* out);
    NodeId element_to_directive(NodeId node, CompilationContext& ctx);
    NodeId component_to_directive(NodeId node, CompilationContext& ctx);
    NodeId fragment_to_directive(NodeId node, CompilationContext& ctx);
    bool compile_attribute_directive(const Found& found, CompilationContext& ctx,
                                     std::vector<AttributeNode>* attributes,
                                     std::vector<AttributeNode>* produced);
};

// shared by extraction and compilation: records ERR_UNKNOWN_DIRECTIVE
bool fail_unknown_directive(CompilationContext& ctx, const std::string& name,
                            uint32_t line, uint32_t column);

// "<?= expr ?>" / "<?php echo expr ?>" -> "expr"
std::string strip_code_markers(const std::string& code);

// ============================================================================
// Directive pairing
// ============================================================================

// Links each paired directive to the next sibling directive it pairs with.
// Only whitespace-only text may sit between the two; any other node,
// including an unrelated directive, ends the search.
class DirectivePairingPass : public AstPass {
public:
    const char* name() const override { return "directive-pairing"; }
    NodeAction before(NodeId node, PipelineContext& context) override;

private:
    void pair_list(const std::vector<NodeId>& list, CompilationContext& ctx);
};

// ============================================================================
// Directive compilation
// ============================================================================

// Runs in after(), once the directive's children are compiled. A paired
// chain is compiled when its last member is reached, so every branch body
// is already compiled; the earlier members are removed.
class DirectiveCompilationPass : public AstPass {
public:
    const char* name() const override { return "directive-compilation"; }
    NodeAction after(NodeId node, PipelineContext& context) override;

private:
    bool has_enclosing(const CompilationContext& ctx, NodeId node, const std::string& name) const;
};

// ============================================================================
// Context analysis
// ============================================================================

class ContextAnalysisPass : public AstPass {
public:
    const char* name() const override { return "context-analysis"; }
    NodeAction before(NodeId node, PipelineContext& context) override;

private:
    OutputContext body_context(const NodeStore& store, NodeId node) const;
    void update_attribute_outputs(NodeStore& store, NodeId element);
};

} // namespace glaze

#endif // GLAZE_PASSES_HPP

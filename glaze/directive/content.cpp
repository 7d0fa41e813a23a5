// content.cpp - text/html body directives, the nowrap modifier and
// pass-through names reserved for other stages

#include "builtin.hpp"
#include "registry.hpp"
#include "../parser/pipe_parser.hpp"

namespace glaze {

// The element body becomes a single output; the original children are
// dropped. Pipe stages and markers behave as in <?= ?>.
static bool compile_content(CompilationContext& ctx, NodeId node, bool escape, std::vector<NodeId>* out) {
    const Node& n = ctx.store.get(node);
    PipeChain chain = parse_pipes(n.expression);

    OutputContext context = escape ? OutputContext::HTML : OutputContext::RAW;
    bool explicit_context = !escape;
    if (chain.raw) {
        escape = false;
        context = OutputContext::RAW;
        explicit_context = true;
    } else if (chain.json) {
        context = OutputContext::JSON;
        explicit_context = true;
    } else if (chain.url) {
        context = OutputContext::URL;
        explicit_context = true;
    }

    NodeId output = ctx.store.make_output(chain.expression, escape, context, n.line, n.column);
    Node& o = ctx.store.get(output);
    o.pipes = std::move(chain.pipes);
    o.context_explicit = explicit_context;
    out->push_back(output);
    return true;
}

static bool compile_text(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    return compile_content(ctx, node, true, out);
}

static bool compile_html(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    return compile_content(ctx, node, false, out);
}

void register_content_directives(DirectiveRegistry& registry) {
    registry.define(make_directive("text", DirectiveType::CONTENT, compile_text,
        "replace the body with an escaped expression"));
    registry.define(make_directive("html", DirectiveType::CONTENT, compile_html,
        "replace the body with an unescaped expression"));

    DirectiveDef def = make_directive("nowrap", DirectiveType::CONTENT, nullptr,
        "with text or html, drop the host element");
    def.wraps_content = true;
    def.keep_wrapper = false;
    registry.define(def);

    const char* reserved[] = {"slot", "bind", "raw"};
    for (const char* name : reserved) {
        registry.define(make_directive(name, DirectiveType::PASS_THROUGH, nullptr,
            "handled outside the directive passes"));
    }
}

} // namespace glaze

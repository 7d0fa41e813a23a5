#include "passes.hpp"
#include "../directive/registry.hpp"
#include "../../lib/log.h"

namespace glaze {

bool DirectiveCompilationPass::has_enclosing(const CompilationContext& ctx, NodeId node,
                                             const std::string& name) const {
    const NodeStore& store = ctx.store;
    for (NodeId id = store.get(node).parent; id != NO_NODE; id = store.get(id).parent) {
        const Node& ancestor = store.get(id);
        if (ancestor.is(NodeType::DIRECTIVE) && ancestor.name == name) return true;
    }
    return false;
}

NodeAction DirectiveCompilationPass::after(NodeId node, PipelineContext& context) {
    CompilationContext& ctx = context.compilation;
    NodeStore& store = ctx.store;
    const Node& n = store.get(node);
    if (!n.is(NodeType::DIRECTIVE)) return NodeAction::none();

    const DirectiveDef* def = ctx.registry->lookup(n.name);
    if (!def) {
        fail_unknown_directive(ctx, n.name, n.line, n.column);
        return NodeAction::fail();
    }
    // case/default: the enclosing switch collects them
    if (!def->enclosing.empty() && has_enclosing(ctx, node, def->enclosing)) {
        return NodeAction::none();
    }

    // earlier members of a paired chain wait for the last one
    if (n.paired != NO_NODE) return NodeAction::replace({});

    NodeId head = node;
    while (store.get(head).paired_from != NO_NODE) head = store.get(head).paired_from;
    const DirectiveDef* head_def = head == node ? def : ctx.registry->lookup(store.get(head).name);
    if (!head_def) {
        fail_unknown_directive(ctx, store.get(head).name, store.get(head).line, store.get(head).column);
        return NodeAction::fail();
    }
    if (!head_def->compile) {
        ctx.fail_at(ERR_MISPLACED_DIRECTIVE,
            ctx.config->build_name(head_def->name) + " cannot be used as a standalone directive", head);
        return NodeAction::fail();
    }

    std::vector<NodeId> out;
    if (!head_def->compile(head, ctx, &out)) return NodeAction::fail();
    log_debug("glaze compile: %s at %u:%u -> %zu nodes", ctx.config->build_name(head_def->name).c_str(),
              store.get(head).line, store.get(head).column, out.size());
    return NodeAction::replace(out, true);
}

} // namespace glaze

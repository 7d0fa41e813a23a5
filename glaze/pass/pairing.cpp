#include "passes.hpp"
#include "../directive/registry.hpp"

namespace glaze {

NodeAction DirectivePairingPass::before(NodeId node, PipelineContext& context) {
    CompilationContext& ctx = context.compilation;
    const Node& n = ctx.store.get(node);
    if (!n.is_container()) return NodeAction::none();

    pair_list(n.children, ctx);
    if (!n.else_children.empty()) pair_list(n.else_children, ctx);
    return NodeAction::none();
}

void DirectivePairingPass::pair_list(const std::vector<NodeId>& list, CompilationContext& ctx) {
    NodeStore& store = ctx.store;
    for (size_t i = 0; i < list.size(); i++) {
        Node& head = store.get(list[i]);
        if (!head.is(NodeType::DIRECTIVE) || head.paired != NO_NODE) continue;
        const DirectiveDef* def = ctx.registry->lookup(head.name);
        if (!def || !def->is_paired()) continue;

        for (size_t j = i + 1; j < list.size(); j++) {
            if (is_whitespace_text(store, list[j])) continue;
            Node& next = store.get(list[j]);
            if (next.is(NodeType::DIRECTIVE) && !next.consumed && def->pairs_with_name(next.name) &&
                ctx.registry->has(next.name)) {
                head.paired = list[j];
                next.paired_from = list[i];
                next.consumed = true;
            }
            break;
        }
    }
}

} // namespace glaze

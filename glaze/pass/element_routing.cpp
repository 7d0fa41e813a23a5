#include "passes.hpp"
#include "../directive/registry.hpp"

namespace glaze {

NodeAction ElementRoutingPass::before(NodeId node, PipelineContext& context) {
    CompilationContext& ctx = context.compilation;
    NodeStore& store = ctx.store;

    if (store.get(node).is_container()) {
        std::vector<NodeId> children = store.get(node).children;
        bool changed = false;
        for (size_t i = 0; i < children.size(); i++) {
            if (!store.get(children[i]).is(NodeType::COMPONENT)) continue;
            NodeId routed = route(children[i], ctx);
            if (routed == NO_NODE) return NodeAction::fail();
            if (routed != children[i]) {
                children[i] = routed;
                changed = true;
            }
        }
        if (changed) store.set_children(node, children);
    }

    if (store.get(node).is(NodeType::COMPONENT)) {
        NodeId routed = route(node, ctx);
        if (routed == NO_NODE) return NodeAction::fail();
        if (routed != node) return NodeAction::replace({routed});
    }
    return NodeAction::none();
}

NodeId ElementRoutingPass::route(NodeId component, CompilationContext& ctx) {
    const Config& config = *ctx.config;
    NodeStore& store = ctx.store;
    const Node& node = store.get(component);

    const DirectiveDef* def = ctx.registry->lookup(node.tag);
    if (!def || !def->claims_element()) return component;

    std::string expression;
    std::vector<AttributeNode> directive_attrs;
    for (const AttributeNode& attr : node.attributes) {
        if (attr.name == def->claim_attribute) {
            if (attr.value.is_boolean()) {
                expression = "true";
            } else if (attr.value.is_static()) {
                expression = attr.value.static_text();
            } else {
                ctx.fail(ERR_DYNAMIC_DIRECTIVE_VALUE,
                    "The \"" + def->claim_attribute + "\" expression attribute on a custom element "
                    "directive must be a static PHP expression, not a dynamic output expression.",
                    attr.line, attr.column);
                return NO_NODE;
            }
            continue;
        }
        if (!config.is_directive(attr.name)) {
            const std::string& p = config.directive_prefix;
            ctx.fail(ERR_INVALID_ATTRIBUTE,
                "Custom element directive \"<" + config.element_prefix + node.tag + ">\" only accepts "
                "directive attributes (e.g. " + p + ":if, " + p + ":foreach). Regular HTML attribute \"" +
                attr.name + "\" is not allowed.",
                attr.line, attr.column);
            return NO_NODE;
        }
        directive_attrs.push_back(attr);
    }

    // the claimed directive goes first, ahead of the element's own directives
    AttributeNode synthesized;
    synthesized.name = config.build_name(node.tag);
    synthesized.value = AttributeValue::of_static(expression);
    synthesized.line = node.line;
    synthesized.column = node.column;

    NodeId fragment = store.make_fragment(node.line, node.column);
    Node& f = store.get(fragment);
    f.attributes.push_back(synthesized);
    f.attributes.insert(f.attributes.end(), directive_attrs.begin(), directive_attrs.end());
    store.set_children(fragment, store.get(component).children);
    return fragment;
}

} // namespace glaze

#include "passes.hpp"
#include "../str_util.hpp"

namespace glaze {

// any <script> ancestor makes JavaScript, else any <style> ancestor CSS
OutputContext ContextAnalysisPass::body_context(const NodeStore& store, NodeId node) const {
    bool in_style = false;
    for (NodeId id = store.get(node).parent; id != NO_NODE; id = store.get(id).parent) {
        const Node& ancestor = store.get(id);
        if (!ancestor.is(NodeType::ELEMENT)) continue;
        if (str_iequals(ancestor.tag, "script")) return OutputContext::JAVASCRIPT;
        if (str_iequals(ancestor.tag, "style")) in_style = true;
    }
    return in_style ? OutputContext::CSS : OutputContext::HTML;
}

void ContextAnalysisPass::update_attribute_outputs(NodeStore& store, NodeId element) {
    std::vector<NodeId> outputs;
    for (const AttributeNode& attr : store.get(element).attributes) {
        if (attr.value.is_output()) {
            outputs.push_back(attr.value.output());
        } else if (attr.value.is_parts()) {
            for (const AttributePart& part : attr.value.parts()) {
                if (part.is_output) outputs.push_back(part.output);
            }
        }
    }
    for (NodeId id : outputs) {
        Node& output = store.get(id);
        if (output.escape && !output.context_explicit) output.context = OutputContext::HTML_ATTRIBUTE;
    }
}

NodeAction ContextAnalysisPass::before(NodeId node, PipelineContext& context) {
    NodeStore& store = context.compilation.store;
    Node& n = store.get(node);
    if (n.is(NodeType::ELEMENT)) {
        update_attribute_outputs(store, node);
    } else if (n.is(NodeType::OUTPUT) && n.escape && !n.context_explicit) {
        n.context = body_context(store, node);
    }
    return NodeAction::none();
}

} // namespace glaze

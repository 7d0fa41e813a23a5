#include "builtin.hpp"
#include "../str_util.hpp"

#include <stdio.h>

namespace glaze {

NodeId raw_code_at(CompilationContext& ctx, const std::string& code, NodeId origin) {
    const Node& node = ctx.store.get(origin);
    return ctx.store.make_raw_code(code, node.line, node.column);
}

void append_nodes(std::vector<NodeId>* out, const std::vector<NodeId>& nodes) {
    out->insert(out->end(), nodes.begin(), nodes.end());
}

bool use_wrapper_mode(const NodeStore& store, NodeId directive) {
    const Node& node = store.get(directive);
    if (node.children.size() != 1) return false;
    const Node& child = store.get(node.children[0]);
    if (!child.is(NodeType::ELEMENT) || child.self_closing) return false;

    int elements = 0;
    for (NodeId id : child.children) {
        const Node& grandchild = store.get(id);
        if (grandchild.is(NodeType::ELEMENT)) {
            elements++;
        } else if (grandchild.is(NodeType::OUTPUT) || grandchild.is(NodeType::RAW_BODY)) {
            return false;
        } else if (grandchild.is(NodeType::TEXT) && !str_is_blank(grandchild.text)) {
            return false;
        }
    }
    return elements > 0;
}

std::string unique_variable(const char* kind, const std::string& expression,
                            const NodeStore& store, NodeId origin) {
    const Node& node = store.get(origin);
    char position[32];
    snprintf(position, sizeof(position), "%u_%u", node.line, node.column);
    return std::string("$__") + kind + "_" + short_hash(expression + position);
}

std::string directive_label(const CompilationContext& ctx, const std::string& name) {
    return ctx.config->build_name(name);
}

DirectiveDef make_directive(const char* name, DirectiveType type, DirectiveCompileFn compile,
                            const char* description) {
    DirectiveDef def;
    def.name = name;
    def.type = type;
    def.compile = compile;
    def.description = description;
    return def;
}

} // namespace glaze

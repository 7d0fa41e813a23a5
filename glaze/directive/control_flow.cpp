// control_flow.cpp - conditionals, switch, try and the block/content guards

#include "builtin.hpp"
#include "registry.hpp"
#include "../codegen/escaper.hpp"
#include "../parser/pipe_parser.hpp"
#include "../re2_patterns.hpp"
#include "../str_util.hpp"

namespace glaze {

// ============================================================================
// Conditionals
// ============================================================================

// if (COND): children [else: else_children] endif;
static bool compile_conditional(CompilationContext& ctx, NodeId node, const std::string& condition,
                                std::vector<NodeId>* out) {
    const Node& n = ctx.store.get(node);
    out->push_back(raw_code_at(ctx, "if (" + condition + "):", node));
    append_nodes(out, n.children);
    if (!n.else_children.empty()) {
        out->push_back(raw_code_at(ctx, "else:", node));
        append_nodes(out, n.else_children);
    }
    out->push_back(raw_code_at(ctx, "endif;", node));
    return true;
}

// one branch of an if/elseif/else chain, followed by the rest of the chain
static bool compile_if_branch(CompilationContext& ctx, NodeId node, std::vector<NodeId>* out) {
    const Node& n = ctx.store.get(node);
    if (n.name == "if") {
        out->push_back(raw_code_at(ctx, "if (" + n.expression + "):", node));
    } else if (n.name == "elseif") {
        out->push_back(raw_code_at(ctx, "elseif (" + n.expression + "):", node));
    } else {
        out->push_back(raw_code_at(ctx, "else:", node));
    }
    append_nodes(out, n.children);

    if (n.paired != NO_NODE) {
        return compile_if_branch(ctx, n.paired, out);
    }
    if (!n.else_children.empty() && n.name != "else") {
        out->push_back(raw_code_at(ctx, "else:", node));
        append_nodes(out, n.else_children);
    }
    return true;
}

static bool compile_if(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    if (!compile_if_branch(ctx, node, out)) return false;
    if (ctx.store.get(node).name == "if") {
        out->push_back(raw_code_at(ctx, "endif;", node));
    }
    return true;
}

static bool compile_unless(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    return compile_conditional(ctx, node, "!(" + ctx.store.get(node).expression + ")", out);
}

static bool compile_isset(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    return compile_conditional(ctx, node, "isset(" + ctx.store.get(node).expression + ")", out);
}

static bool compile_empty(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    std::string condition = ctx.config->runtime_class("EmptyHelper") +
        "::isEmpty(" + ctx.store.get(node).expression + ")";
    return compile_conditional(ctx, node, condition, out);
}

static bool compile_notempty(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    std::string condition = "!" + ctx.config->runtime_class("EmptyHelper") +
        "::isEmpty(" + ctx.store.get(node).expression + ")";
    return compile_conditional(ctx, node, condition, out);
}

// ============================================================================
// Switch
// ============================================================================

struct SwitchArms {
    std::vector<NodeId> cases;
    NodeId default_arm = NO_NODE;
    bool any = false;
};

static bool collect_switch_arm(CompilationContext& ctx, NodeId id, SwitchArms* arms) {
    const Node& n = ctx.store.get(id);
    if (!n.is(NodeType::DIRECTIVE)) return true;
    if (n.name == "case") {
        if (str_is_blank(n.expression)) {
            return ctx.fail_at(ERR_INVALID_DIRECTIVE_EXPRESSION,
                "Case directive requires a value expression", id);
        }
        arms->cases.push_back(id);
        arms->any = true;
    } else if (n.name == "default") {
        if (arms->default_arm != NO_NODE) {
            return ctx.fail_at(ERR_DIRECTIVE_CONFLICT,
                "Switch directive can only have one default case", id);
        }
        arms->default_arm = id;
        arms->any = true;
    }
    return true;
}

static bool compile_switch(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    SwitchArms arms;
    // arms sit directly under the switch, or one element down after extraction
    std::vector<NodeId> children = ctx.store.get(node).children;
    for (NodeId child : children) {
        if (!collect_switch_arm(ctx, child, &arms)) return false;
        const Node& c = ctx.store.get(child);
        if (c.is(NodeType::ELEMENT)) {
            for (NodeId grandchild : c.children) {
                if (!collect_switch_arm(ctx, grandchild, &arms)) return false;
            }
        }
    }
    if (!arms.any) {
        return ctx.fail_at(ERR_SYNTAX_ERROR, "Switch directive must contain at least one case or default", node);
    }

    out->push_back(raw_code_at(ctx, "switch (" + ctx.store.get(node).expression + "):", node));
    for (NodeId arm : arms.cases) {
        out->push_back(raw_code_at(ctx, "case " + ctx.store.get(arm).expression + ":", arm));
        append_nodes(out, ctx.store.get(arm).children);
        out->push_back(raw_code_at(ctx, "break;", arm));
    }
    if (arms.default_arm != NO_NODE) {
        out->push_back(raw_code_at(ctx, "default:", arms.default_arm));
        append_nodes(out, ctx.store.get(arms.default_arm).children);
    }
    out->push_back(raw_code_at(ctx, "endswitch;", node));
    return true;
}

// reached only when no enclosing s:switch exists
static bool compile_switch_arm(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    (void)out;
    const Node& n = ctx.store.get(node);
    return ctx.fail_at(ERR_MISPLACED_DIRECTIVE,
        directive_label(ctx, n.name) + " must be placed inside " + directive_label(ctx, "switch"), node);
}

// ============================================================================
// Try / finally
// ============================================================================

static bool compile_try(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    const Node& n = ctx.store.get(node);
    out->push_back(raw_code_at(ctx, "try {", node));
    append_nodes(out, n.children);

    const std::vector<NodeId>* finally_body = nullptr;
    if (n.paired != NO_NODE) finally_body = &ctx.store.get(n.paired).children;
    else if (!n.else_children.empty()) finally_body = &n.else_children;

    if (finally_body) {
        out->push_back(raw_code_at(ctx, "} finally {", node));
        append_nodes(out, *finally_body);
        out->push_back(raw_code_at(ctx, "}", node));
        return true;
    }
    out->push_back(raw_code_at(ctx, "} catch (\\Throwable $__e) {", node));
    out->push_back(raw_code_at(ctx, "return null;", node));
    out->push_back(raw_code_at(ctx, "}", node));
    return true;
}

// else, elseif and finally are compiled by the head of their chain
static bool compile_unpaired_branch(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    (void)out;
    const Node& n = ctx.store.get(node);
    const DirectiveDef* def = ctx.registry ? ctx.registry->lookup(n.name) : nullptr;
    std::string expected;
    if (def) {
        for (size_t i = 0; i < def->follows.size(); i++) {
            if (i > 0) expected += i + 1 == def->follows.size() ? " or " : ", ";
            expected += directive_label(ctx, def->follows[i]);
        }
    }
    return ctx.fail_at(ERR_MISPLACED_DIRECTIVE,
        directive_label(ctx, n.name) + " must directly follow " + expected, node);
}

// ============================================================================
// Block guard
// ============================================================================

static std::string normalize_block_name(const std::string& expression) {
    std::string trimmed = str_trim(expression);
    if (trimmed.empty()) return "''";
    if (str_starts_with(trimmed, "'") || str_starts_with(trimmed, "\"") ||
        str_starts_with(trimmed, "$") || str_starts_with(trimmed, "(") ||
        str_starts_with(trimmed, "array(") || str_starts_with(trimmed, "[")) {
        return trimmed;
    }
    if (pattern_full_match(pattern_block_name(), trimmed)) return php_quote(trimmed);
    return trimmed;
}

static bool compile_ifblock(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    const Config& config = *ctx.config;
    std::string condition = "\\" + config.runtime_class("RuntimeEnvironment") +
        "::requireService(\\" + config.runtime_class("TemplateRenderer") + "::class)" +
        "->hasDefinedBlock(" + normalize_block_name(ctx.store.get(node).expression) + ")";
    return compile_conditional(ctx, node, condition, out);
}

// ============================================================================
// Content guard
// ============================================================================

static NodeId extract_ifcontent(NodeId element, const std::string& expression, CompilationContext& ctx) {
    NodeStore& store = ctx.store;
    const Node& el = store.get(element);
    NodeId directive = store.make_directive("ifcontent", expression, el.line, el.column);
    std::vector<NodeId> body = el.children;
    NodeId meta = store.clone_with(element, store.get(element).attributes, std::vector<NodeId>());
    store.set_children(directive, body);
    store.get(directive).element_meta = meta;
    return directive;
}

// echo statements rebuilding one attribute of the captured element
static void emit_meta_attribute(CompilationContext& ctx, NodeId node, const AttributeNode& attr,
                                std::vector<NodeId>* out) {
    NodeStore& store = ctx.store;
    if (attr.name.empty()) {
        if (!attr.value.is_output()) return;
        const Node& output = store.get(attr.value.output());
        std::string expression = compile_pipes(output.expression, output.pipes);
        out->push_back(raw_code_at(ctx, "$__ifcontent_attr = " + expression + ";" +
            " if ($__ifcontent_attr !== '') { echo ' ' . $__ifcontent_attr; }", node));
        return;
    }
    if (attr.value.is_boolean()) {
        out->push_back(raw_code_at(ctx, "echo " + php_quote(" " + attr.name) + ";", node));
        return;
    }
    if (attr.value.is_static()) {
        std::string text = " " + attr.name + "=\"" + attr.value.static_text() + "\"";
        out->push_back(raw_code_at(ctx, "echo " + php_quote(text) + ";", node));
        return;
    }

    out->push_back(raw_code_at(ctx, "echo " + php_quote(" " + attr.name + "=\"") + ";", node));
    std::vector<AttributePart> parts;
    attr.value.to_parts(&parts);
    for (const AttributePart& part : parts) {
        if (!part.is_output) {
            out->push_back(raw_code_at(ctx, "echo " + php_quote(part.text) + ";", node));
            continue;
        }
        const Node& output = store.get(part.output);
        std::string expression = compile_pipes(output.expression, output.pipes);
        if (output.escape) expression = generate_escape_code(expression, output.context);
        out->push_back(raw_code_at(ctx, "echo " + expression + ";", node));
    }
    out->push_back(raw_code_at(ctx, "echo " + php_quote("\"") + ";", node));
}

static bool compile_ifcontent(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    NodeStore& store = ctx.store;
    std::string var = unique_variable("content", store.get(node).expression, store, node);

    out->push_back(raw_code_at(ctx, "ob_start();", node));
    append_nodes(out, store.get(node).children);
    out->push_back(raw_code_at(ctx, var + " = ob_get_clean();\nif (trim(" + var + ") !== ''):", node));

    NodeId meta = store.get(node).element_meta;
    if (meta == NO_NODE) {
        out->push_back(raw_code_at(ctx, "echo " + var + ";", node));
        out->push_back(raw_code_at(ctx, "endif;", node));
        return true;
    }

    const Node& element = store.get(meta);
    const std::string& tag = element.tag;
    const std::string& dynamic_tag = element.dynamic_tag;

    if (!dynamic_tag.empty()) out->push_back(raw_code_at(ctx, "echo '<' . " + dynamic_tag + ";", node));
    else out->push_back(raw_code_at(ctx, "echo " + php_quote("<" + tag) + ";", node));

    for (const AttributeNode& attr : element.attributes) {
        emit_meta_attribute(ctx, node, attr, out);
    }
    out->push_back(raw_code_at(ctx, "echo '>';", node));
    out->push_back(raw_code_at(ctx, "echo " + var + ";", node));
    if (!element.self_closing) {
        if (!dynamic_tag.empty()) out->push_back(raw_code_at(ctx, "echo '</' . " + dynamic_tag + " . '>';", node));
        else out->push_back(raw_code_at(ctx, "echo " + php_quote("</" + tag + ">") + ";", node));
    }
    out->push_back(raw_code_at(ctx, "endif;", node));
    return true;
}

// ============================================================================
// Registration
// ============================================================================

void register_control_flow_directives(DirectiveRegistry& registry) {
    DirectiveDef def = make_directive("if", DirectiveType::CONTROL_FLOW, compile_if,
        "render children when the expression is truthy");
    def.pairs_with = {"elseif", "else"};
    registry.define(def);

    def = make_directive("elseif", DirectiveType::CONTROL_FLOW, compile_unpaired_branch,
        "alternate condition of a preceding if");
    def.pairs_with = {"elseif", "else"};
    def.follows = {"if", "elseif"};
    registry.define(def);

    def = make_directive("else", DirectiveType::CONTROL_FLOW, compile_unpaired_branch,
        "fallback branch of a preceding if or elseif");
    def.follows = {"if", "elseif"};
    registry.define(def);

    registry.define(make_directive("unless", DirectiveType::CONTROL_FLOW, compile_unless,
        "render children when the expression is falsy"));
    registry.define(make_directive("isset", DirectiveType::CONTROL_FLOW, compile_isset,
        "render children when every variable is set"));
    registry.define(make_directive("empty", DirectiveType::CONTROL_FLOW, compile_empty,
        "render children when the value is empty"));
    registry.define(make_directive("notempty", DirectiveType::CONTROL_FLOW, compile_notempty,
        "render children when the value is not empty"));

    registry.define(make_directive("switch", DirectiveType::CONTROL_FLOW, compile_switch,
        "select one case by value"));
    def = make_directive("case", DirectiveType::CONTROL_FLOW, compile_switch_arm, "switch arm");
    def.enclosing = "switch";
    registry.define(def);
    def = make_directive("default", DirectiveType::CONTROL_FLOW, compile_switch_arm, "switch fallback arm");
    def.enclosing = "switch";
    registry.define(def);

    def = make_directive("try", DirectiveType::CONTROL_FLOW, compile_try,
        "guard children; failures render nothing unless a finally follows");
    def.pairs_with = {"finally"};
    registry.define(def);
    def = make_directive("finally", DirectiveType::CONTROL_FLOW, compile_unpaired_branch,
        "cleanup branch of a preceding try");
    def.follows = {"try"};
    registry.define(def);

    def = make_directive("ifblock", DirectiveType::CONTROL_FLOW, compile_ifblock,
        "render children when a template block is defined");
    def.claim_attribute = "name";
    registry.define(def);

    def = make_directive("ifcontent", DirectiveType::CONTROL_FLOW, compile_ifcontent,
        "render the host element only when its body is not blank");
    def.extract = extract_ifcontent;
    registry.define(def);
}

} // namespace glaze

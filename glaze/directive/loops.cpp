// loops.cpp - foreach, forelse, while and times
//
// Every loop has two code shapes. In wrapper mode (see use_wrapper_mode())
// the host element is emitted once and the loop runs inside it:
//
//   <ul s:foreach="$items as $item"><li>...</li></ul>
//   -> <ul> foreach: <li>...</li> endforeach; </ul>
//
// Otherwise the host element itself repeats:
//
//   <li s:foreach="$items as $item">...</li>
//   -> foreach: <li>...</li> endforeach;

#include "builtin.hpp"
#include "registry.hpp"
#include "../re2_patterns.hpp"
#include "../str_util.hpp"

namespace glaze {

// ============================================================================
// Shared loop shapes
// ============================================================================

// wraps `body` in opening/closing code, honoring wrapper mode
static void emit_loop(CompilationContext& ctx, NodeId node, const std::vector<NodeId>& opening,
                      const std::vector<NodeId>& closing, std::vector<NodeId>* out) {
    NodeStore& store = ctx.store;
    if (use_wrapper_mode(store, node)) {
        NodeId wrapper = store.get(node).children[0];
        std::vector<NodeId> content = opening;
        append_nodes(&content, store.get(wrapper).children);
        append_nodes(&content, closing);
        out->push_back(store.clone_with(wrapper, store.get(wrapper).attributes, content));
        return;
    }
    append_nodes(out, opening);
    append_nodes(out, store.get(node).children);
    append_nodes(out, closing);
}

// left side of "<left> as <right>", or the whole expression
static std::string loop_collection(const std::string& expression) {
    std::string left, right;
    if (re2::RE2::FullMatch(expression, pattern_as_split(), &left, &right)) return str_trim(left);
    return str_trim(expression);
}

// ============================================================================
// foreach
// ============================================================================

static bool validate_foreach(CompilationContext& ctx, NodeId node) {
    const Node& n = ctx.store.get(node);
    std::string expression = str_trim(n.expression);
    if (expression.empty() || !pattern_full_match(pattern_foreach_clause(), expression)) {
        return ctx.fail_at(ERR_INVALID_DIRECTIVE_EXPRESSION,
            directive_label(ctx, n.name) + " requires an expression like \"$items as $item\".", node);
    }
    return true;
}

static void emit_foreach(CompilationContext& ctx, NodeId node, std::vector<NodeId>* out) {
    std::string expression = ctx.store.get(node).expression;
    std::string collection = loop_collection(expression);

    std::vector<NodeId> opening;
    opening.push_back(raw_code_at(ctx, "$__loopStack ??= [];", node));
    opening.push_back(raw_code_at(ctx, "$__loopStack[] = $loop ?? null;", node));
    opening.push_back(raw_code_at(ctx, "$loop = new \\" + ctx.config->runtime_class("LoopMetadata") +
        "(" + collection + ", end($__loopStack));", node));
    opening.push_back(raw_code_at(ctx, "foreach (" + expression + "):", node));

    std::vector<NodeId> closing;
    closing.push_back(raw_code_at(ctx, "$loop->next();", node));
    closing.push_back(raw_code_at(ctx, "endforeach;", node));
    closing.push_back(raw_code_at(ctx, "$loop = array_pop($__loopStack);", node));

    emit_loop(ctx, node, opening, closing, out);
}

static bool compile_foreach(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    if (!validate_foreach(ctx, node)) return false;
    emit_foreach(ctx, node, out);
    return true;
}

// ============================================================================
// forelse
// ============================================================================

static bool compile_forelse(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    if (!validate_foreach(ctx, node)) return false;

    const Node& n = ctx.store.get(node);
    const std::vector<NodeId>* empty_body = nullptr;
    if (n.paired != NO_NODE) empty_body = &ctx.store.get(n.paired).children;
    else if (!n.else_children.empty()) empty_body = &n.else_children;

    if (!empty_body) {
        emit_foreach(ctx, node, out);
        return true;
    }

    std::string collection = loop_collection(n.expression);
    out->push_back(raw_code_at(ctx, "if (!" + ctx.config->runtime_class("EmptyHelper") +
        "::isEmpty(" + collection + ")):", node));
    emit_foreach(ctx, node, out);
    out->push_back(raw_code_at(ctx, "else:", node));
    append_nodes(out, *empty_body);
    out->push_back(raw_code_at(ctx, "endif;", node));
    return true;
}

// ============================================================================
// while
// ============================================================================

static bool compile_while(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    std::vector<NodeId> opening{raw_code_at(ctx, "while (" + ctx.store.get(node).expression + "):", node)};
    std::vector<NodeId> closing{raw_code_at(ctx, "endwhile;", node)};
    emit_loop(ctx, node, opening, closing, out);
    return true;
}

// ============================================================================
// times
// ============================================================================

// "<count>" or "<count> as $i"
static bool parse_times(CompilationContext& ctx, NodeId node, std::string* count, std::string* index) {
    const Node& n = ctx.store.get(node);
    std::string raw = str_trim(n.expression);
    std::string left, right;
    if (re2::RE2::FullMatch(raw, pattern_as_split(), &left, &right)) {
        *count = str_trim(left);
        *index = str_trim(right);
    } else {
        *count = raw;
        index->clear();
    }
    if (count->empty()) {
        return ctx.fail_at(ERR_INVALID_DIRECTIVE_EXPRESSION,
            directive_label(ctx, n.name) + " requires a count expression.", node);
    }
    if (index->empty()) {
        *index = unique_variable("times", raw, ctx.store, node);
    } else if (!pattern_full_match(pattern_variable_name(), *index)) {
        return ctx.fail_at(ERR_INVALID_DIRECTIVE_EXPRESSION,
            directive_label(ctx, n.name) + " index must be a valid variable name.", node);
    }
    return true;
}

static bool compile_times(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    std::string count, index;
    if (!parse_times(ctx, node, &count, &index)) return false;
    std::string code = "for (" + index + " = 0; " + index + " < (" + count + "); " + index + "++):";
    std::vector<NodeId> opening{raw_code_at(ctx, code, node)};
    std::vector<NodeId> closing{raw_code_at(ctx, "endfor;", node)};
    emit_loop(ctx, node, opening, closing, out);
    return true;
}

// ============================================================================
// Registration
// ============================================================================

void register_loop_directives(DirectiveRegistry& registry) {
    registry.define(make_directive("foreach", DirectiveType::CONTROL_FLOW, compile_foreach,
        "repeat for each item, with $loop metadata"));

    DirectiveDef def = make_directive("forelse", DirectiveType::CONTROL_FLOW, compile_forelse,
        "foreach with a fallback branch for empty collections");
    def.pairs_with = {"empty"};
    registry.define(def);

    registry.define(make_directive("while", DirectiveType::CONTROL_FLOW, compile_while,
        "repeat while the condition holds"));
    registry.define(make_directive("times", DirectiveType::CONTROL_FLOW, compile_times,
        "repeat a fixed number of times"));
}

} // namespace glaze

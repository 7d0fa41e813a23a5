// extraction.cpp - turns s:name attributes into DIRECTIVE nodes
//
//   <li s:if="$x" s:class="$c">..</li>
//   -> DIRECTIVE if($x) [ <li class="<?= classNames($c) ?>">..</li> ]
//
// Control flow wraps the element, content directives wrap its body and
// attribute directives are compiled into attributes once every static
// attribute of the element is known. Children
// are converted from the parent's before() hook so that pairing, which
// runs next on the parent, sees sibling directives.

#include "passes.hpp"
#include "../directive/registry.hpp"
#include "../re2_patterns.hpp"
#include "../str_util.hpp"
#include "../../lib/log.h"

#include <utility>

namespace glaze {

bool fail_unknown_directive(CompilationContext& ctx, const std::string& name,
                            uint32_t line, uint32_t column) {
    std::string suggestion = did_you_mean(name, ctx.registry->names());
    std::string message = "Unknown directive \"" + name + "\"";
    if (!suggestion.empty()) message += ". Did you mean \"" + suggestion + "\"?";
    return ctx.fail(ERR_UNKNOWN_DIRECTIVE, message, line, column, suggestion);
}

std::string strip_code_markers(const std::string& code) {
    std::string s = str_trim(code);
    if (str_starts_with(s, "<?php")) s = s.substr(5);
    else if (str_starts_with(s, "<?=")) s = s.substr(3);
    if (str_ends_with(s, "?>")) s = s.substr(0, s.size() - 2);
    s = str_trim(s);
    if (str_starts_with(s, "echo ")) s = str_trim(s.substr(5));
    return s;
}

// ============================================================================
// Detection
// ============================================================================

bool DirectiveExtractionPass::needs_extraction(const Node& node, CompilationContext& ctx) const {
    const Config& config = *ctx.config;
    bool fragment = node.is(NodeType::FRAGMENT);
    if (!fragment && !node.is(NodeType::ELEMENT) && !node.is(NodeType::COMPONENT)) return false;

    for (const AttributeNode& attr : node.attributes) {
        if (!config.is_directive(attr.name)) {
            // a fragment rejects regular attributes during conversion
            if (fragment && !attr.name.empty()) return true;
            continue;
        }
        const DirectiveDef* def = ctx.registry->lookup(config.strip_prefix(attr.name));
        if (!def || def->wraps_content || def->type != DirectiveType::PASS_THROUGH) return true;
    }
    return false;
}

NodeAction DirectiveExtractionPass::before(NodeId node, PipelineContext& context) {
    CompilationContext& ctx = context.compilation;
    NodeStore& store = ctx.store;

    if (store.get(node).is_container()) {
        std::vector<NodeId> children = store.get(node).children;
        bool changed = false;
        for (size_t i = 0; i < children.size(); i++) {
            if (!needs_extraction(store.get(children[i]), ctx)) continue;
            NodeId converted = transform(children[i], ctx);
            if (converted == NO_NODE) return NodeAction::fail();
            children[i] = converted;
            changed = true;
        }
        if (changed) store.set_children(node, children);
    }

    if (needs_extraction(store.get(node), ctx)) {
        NodeId converted = transform(node, ctx);
        if (converted == NO_NODE) return NodeAction::fail();
        // run extraction again so the new node's children are converted
        return NodeAction::replace({converted}, true);
    }
    return NodeAction::none();
}

NodeId DirectiveExtractionPass::transform(NodeId node, CompilationContext& ctx) {
    switch (ctx.store.get(node).type) {
    case NodeType::ELEMENT:   return element_to_directive(node, ctx);
    case NodeType::COMPONENT: return component_to_directive(node, ctx);
    case NodeType::FRAGMENT:  return fragment_to_directive(node, ctx);
    default:                  return node;
    }
}

// ============================================================================
// Attribute scan
// ============================================================================

bool DirectiveExtractionPass::extract(NodeId node, CompilationContext& ctx, Extracted* out) {
    const Config& config = *ctx.config;
    const std::string& p = config.directive_prefix;
    // copy: compiling attribute directives creates nodes
    std::vector<AttributeNode> attributes = ctx.store.get(node).attributes;

    // attribute directives compile after the scan, in the slot they held
    std::vector<std::pair<size_t, Found>> pending;

    for (const AttributeNode& attr : attributes) {
        if (!config.is_directive(attr.name)) {
            out->remaining.push_back(attr);
            continue;
        }

        Found found;
        found.name = config.strip_prefix(attr.name);
        found.line = attr.line;
        found.column = attr.column;

        if (attr.value.has_output()) {
            return ctx.fail(ERR_DYNAMIC_DIRECTIVE_VALUE,
                "Directive attributes cannot contain dynamic output expressions", attr.line, attr.column);
        }
        found.expression = attr.value.is_boolean() ? "true" : attr.value.static_text();

        found.def = ctx.registry->lookup(found.name);
        if (!found.def) {
            return fail_unknown_directive(ctx, found.name, attr.line,
                (uint32_t)(attr.column + config.marker_length()));
        }
        const DirectiveDef& def = *found.def;

        if (def.wraps_content) {
            out->keep_wrapper = def.keep_wrapper;
            out->modifier = found;
            continue;
        }
        if (def.type == DirectiveType::PASS_THROUGH) {
            out->remaining.push_back(attr);
            continue;
        }
        if (def.type == DirectiveType::CONTROL_FLOW && out->control.found()) {
            return ctx.fail(ERR_DIRECTIVE_CONFLICT,
                "Only one control flow directive allowed per element. Nest elements to combine directives. "
                "Example: <div " + p + ":if=\"$condition\"><div " + p + ":foreach=\"$items as $item\">"
                "...</div></div>", attr.line, attr.column);
        }
        if (def.type == DirectiveType::CONTENT && out->content.found()) {
            return ctx.fail(ERR_DIRECTIVE_CONFLICT,
                "Only one content directive allowed per element. Use either " + p + ":text or " + p +
                ":html, not both.", attr.line, attr.column);
        }

        if (def.has_custom_extraction()) {
            // counts as the element's control flow for the conflict check
            if (def.type == DirectiveType::CONTROL_FLOW) out->control.def = found.def;
            out->custom.push_back(found);
            continue;
        }
        switch (def.type) {
        case DirectiveType::CONTROL_FLOW:
            out->control = found;
            break;
        case DirectiveType::CONTENT:
            out->content = found;
            break;
        case DirectiveType::ATTRIBUTE:
            pending.push_back(std::make_pair(out->remaining.size(), found));
            out->remaining.push_back(AttributeNode());
            break;
        case DirectiveType::PASS_THROUGH:
            break;
        }
    }

    // placeholders are unnamed, so merge targets and exclusions see only real attributes
    long shift = 0;
    for (const std::pair<size_t, Found>& entry : pending) {
        std::vector<AttributeNode> produced;
        if (!compile_attribute_directive(entry.second, ctx, &out->remaining, &produced)) return false;
        std::vector<AttributeNode>::iterator slot = out->remaining.begin() + (long)entry.first + shift;
        slot = out->remaining.erase(slot);
        out->remaining.insert(slot, produced.begin(), produced.end());
        shift += (long)produced.size() - 1;
    }

    if (out->modifier.found() && !out->content.found()) {
        return ctx.fail(ERR_MISPLACED_DIRECTIVE,
            "The " + config.build_name(out->modifier.name) + " directive requires a content directive like " +
            p + ":text or " + p + ":html on the same element.", out->modifier.line, out->modifier.column);
    }
    // a custom-extraction control flow was only marked; its directive comes from extract()
    if (out->control.found() && out->control.name.empty()) out->control = Found();
    return true;
}

// Compiles an attribute directive into `produced`: name="<?= expr ?>"
// becomes a named attribute with a raw output value, anything else a spread
// entry. A merge target is rewritten in place in `attributes`, which holds
// the element's other attributes.
bool DirectiveExtractionPass::compile_attribute_directive(const Found& found, CompilationContext& ctx,
                                                          std::vector<AttributeNode>* attributes,
                                                          std::vector<AttributeNode>* produced) {
    NodeStore& store = ctx.store;
    const DirectiveDef& def = *found.def;

    NodeId directive = store.make_directive(found.name, found.expression, found.line, found.column);
    std::vector<NodeId> compiled;
    if (!def.compile(directive, ctx, &compiled)) return false;

    for (NodeId id : compiled) {
        if (!store.get(id).is(NodeType::RAW_CODE)) continue;
        std::string code = store.get(id).text;

        std::string name, value;
        if (re2::RE2::FullMatch(code, pattern_named_attribute(), &name, &value)) {
            std::string expression = strip_code_markers(value);
            int existing = find_attribute_index(*attributes, name);
            if (def.merge_mode == AttributeMergeMode::MERGE_NAMED && def.merge_named &&
                def.merge_target == name && existing >= 0) {
                AttributeNode& target = (*attributes)[existing];
                std::string merged = def.merge_named(ctx,
                    attribute_value_to_expression(store, target.value), expression);
                NodeId output = store.make_output(merged, false, OutputContext::HTML_ATTRIBUTE,
                                                  target.line, target.column);
                target.value = AttributeValue::of_output(output);
                continue;
            }
            AttributeNode attr;
            attr.name = name;
            attr.value = AttributeValue::of_output(store.make_output(expression, false,
                OutputContext::HTML_ATTRIBUTE, found.line, found.column));
            attr.line = found.line;
            attr.column = found.column;
            produced->push_back(attr);
            continue;
        }

        std::string expression = strip_code_markers(code);
        if (def.merge_mode == AttributeMergeMode::EXCLUDE_NAMED && def.exclude_named) {
            expression = def.exclude_named(ctx, found.expression, collect_named_attribute_names(*attributes));
        }
        AttributeNode spread;
        spread.value = AttributeValue::of_output(store.make_output(expression, false,
            OutputContext::HTML_ATTRIBUTE, found.line, found.column));
        spread.line = found.line;
        spread.column = found.column;
        produced->push_back(spread);
    }
    return true;
}

// ============================================================================
// Element
// ============================================================================

NodeId DirectiveExtractionPass::element_to_directive(NodeId node, CompilationContext& ctx) {
    NodeStore& store = ctx.store;
    Extracted ex;
    if (!extract(node, ctx, &ex)) return NO_NODE;

    uint32_t line = store.get(node).line;
    uint32_t column = store.get(node).column;
    std::vector<NodeId> body = store.get(node).children;

    NodeId content = NO_NODE;
    if (ex.content.found()) {
        content = store.make_directive(ex.content.name, ex.content.expression, line, column);
        store.set_children(content, body);
    }

    if (content != NO_NODE && !ex.keep_wrapper) {
        if (!ex.remaining.empty() || !ex.custom.empty()) {
            ctx.fail(ERR_INVALID_ATTRIBUTE,
                "Content directives without a wrapper cannot include other attributes.", line, column);
            return NO_NODE;
        }
        if (!ex.control.found()) return content;
        NodeId control = store.make_directive(ex.control.name, ex.control.expression, line, column);
        store.append_child(control, content);
        return control;
    }
    if (content != NO_NODE) body = {content};

    NodeId current = store.clone_with(node, ex.remaining, body);
    std::vector<NodeId> prefix;
    for (const Found& found : ex.custom) {
        NodeId result = found.def->extract(current, found.expression, ctx);
        if (result == NO_NODE) return NO_NODE;

        const Node& r = store.get(result);
        if (r.is(NodeType::ELEMENT)) {
            current = result;
            continue;
        }
        if (r.is(NodeType::FRAGMENT)) {
            NodeId element = NO_NODE;
            for (NodeId child : r.children) {
                if (store.get(child).is(NodeType::ELEMENT)) element = child;
                else prefix.push_back(child);
            }
            if (element != NO_NODE) {
                current = element;
                continue;
            }
        }
        current = result;
        break;
    }

    if (ex.control.found()) {
        NodeId control = store.make_directive(ex.control.name, ex.control.expression, line, column);
        std::vector<NodeId> wrapped = prefix;
        wrapped.push_back(current);
        store.set_children(control, wrapped);
        return control;
    }
    if (prefix.empty()) return current;

    NodeId fragment = store.make_fragment(line, column);
    prefix.push_back(current);
    store.set_children(fragment, prefix);
    return fragment;
}

// ============================================================================
// Component
// ============================================================================

NodeId DirectiveExtractionPass::component_to_directive(NodeId node, CompilationContext& ctx) {
    NodeStore& store = ctx.store;
    Extracted ex;
    if (!extract(node, ctx, &ex)) return NO_NODE;

    const Found* unsupported = nullptr;
    if (ex.content.found()) unsupported = &ex.content;
    else if (!ex.custom.empty()) unsupported = &ex.custom[0];
    else if (ex.modifier.found()) unsupported = &ex.modifier;
    if (unsupported) {
        ctx.fail(ERR_DIRECTIVE_CONFLICT,
            "Components support only control flow and attribute directives. Found: " +
            ctx.config->build_name(unsupported->name) + ".", unsupported->line, unsupported->column);
        return NO_NODE;
    }

    NodeId component = store.clone_with(node, ex.remaining, store.get(node).children);
    if (!ex.control.found()) return component;

    const Node& n = store.get(node);
    NodeId control = store.make_directive(ex.control.name, ex.control.expression, n.line, n.column);
    store.append_child(control, component);
    return control;
}

// ============================================================================
// Fragment
// ============================================================================

NodeId DirectiveExtractionPass::fragment_to_directive(NodeId node, CompilationContext& ctx) {
    NodeStore& store = ctx.store;
    const Config& config = *ctx.config;
    const std::string& p = config.directive_prefix;
    std::vector<AttributeNode> attributes = store.get(node).attributes;

    Found control, content;
    // attribute directives compile after the scan, in the slot they held
    std::vector<std::pair<size_t, Found>> pending;

    for (const AttributeNode& attr : attributes) {
        if (!config.is_directive(attr.name)) {
            ctx.fail(ERR_INVALID_ATTRIBUTE,
                "<" + config.fragment_element + "> cannot have regular HTML attributes. Found: " +
                attr.name + ". Only " + p + ": directives are allowed.", attr.line, attr.column);
            return NO_NODE;
        }
        if (attr.value.has_output()) {
            ctx.fail(ERR_DYNAMIC_DIRECTIVE_VALUE,
                "Directive attributes cannot contain dynamic output expressions", attr.line, attr.column);
            return NO_NODE;
        }

        std::string name = config.strip_prefix(attr.name);
        const DirectiveDef* def = ctx.registry->lookup(name);
        if (!def) {
            fail_unknown_directive(ctx, name, attr.line, (uint32_t)(attr.column + config.marker_length()));
            return NO_NODE;
        }
        if (def->wraps_content) {
            ctx.fail(ERR_INVALID_ATTRIBUTE,
                "The " + attr.name + " directive can only be used on elements with " + p + ":text or " +
                p + ":html.", attr.line, attr.column);
            return NO_NODE;
        }
        if (def->type == DirectiveType::PASS_THROUGH) continue;
        if (def->type == DirectiveType::ATTRIBUTE) {
            ctx.fail(ERR_INVALID_ATTRIBUTE,
                "<" + config.fragment_element + "> cannot have attribute directives like " + attr.name +
                ". Only control flow and content directives are allowed.", attr.line, attr.column);
            return NO_NODE;
        }

        Found found;
        found.name = name;
        found.expression = attr.value.is_boolean() ? "true" : attr.value.static_text();
        found.def = def;
        found.line = attr.line;
        found.column = attr.column;

        Found& slot = def->type == DirectiveType::CONTENT ? content : control;
        if (slot.found()) {
            ctx.fail(ERR_DIRECTIVE_CONFLICT, def->type == DirectiveType::CONTENT
                ? "Only one content directive allowed per element. Use either " + p + ":text or " + p +
                  ":html, not both."
                : "Only one control flow directive allowed per element. Nest elements to combine directives.",
                attr.line, attr.column);
            return NO_NODE;
        }
        slot = found;
    }

    const Node& n = store.get(node);
    std::vector<NodeId> body = n.children;
    if (content.found()) {
        NodeId directive = store.make_directive(content.name, content.expression, n.line, n.column);
        store.set_children(directive, body);
        if (!control.found()) return directive;
        body = {directive};
    }
    if (!control.found()) return node;
    NodeId directive = store.make_directive(control.name, control.expression, n.line, n.column);
    store.set_children(directive, body);
    log_debug("glaze extract: %s on <%s> at %u:%u", config.build_name(control.name).c_str(),
              config.fragment_element.c_str(), n.line, n.column);
    return directive;
}

} // namespace glaze

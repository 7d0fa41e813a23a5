// attributes.cpp - directives that rewrite into attributes of their host element
//
// Attribute directives compile to a single code node in one of two forms,
// which the extraction pass turns into an attribute:
//
//   name="<?= expr ?>"    named attribute with a raw output value
//   <?= expr ?>           spread output, written into the tag as-is

#include "builtin.hpp"
#include "registry.hpp"
#include "../str_util.hpp"

#include <algorithm>

namespace glaze {

// ============================================================================
// class
// ============================================================================

static bool compile_class(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    std::string code = "class=\"<?= " + ctx.config->runtime_class("HtmlAttributeHelper") +
        "::classNames(" + ctx.store.get(node).expression + ") ?>\"";
    out->push_back(raw_code_at(ctx, code, node));
    return true;
}

static std::string merge_class(const CompilationContext& ctx, const std::string& existing,
                               const std::string& incoming) {
    return ctx.config->runtime_class("HtmlAttributeHelper") +
        "::classNames([" + existing + ", " + incoming + "])";
}

// ============================================================================
// spread / attr
// ============================================================================

static bool compile_spread(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    std::string code = "<?= " + ctx.config->runtime_class("HtmlAttributeHelper") +
        "::spreadAttrs(" + ctx.store.get(node).expression + ") ?>";
    out->push_back(raw_code_at(ctx, code, node));
    return true;
}

static std::string spread_excluding(const CompilationContext& ctx, const std::string& source,
                                    const std::vector<std::string>& names) {
    std::string helper = ctx.config->runtime_class("HtmlAttributeHelper");
    if (names.empty()) return helper + "::spreadAttrs(" + source + ")";

    std::vector<std::string> keys;
    for (const std::string& name : names) {
        std::string key = php_quote(name) + " => true";
        if (std::find(keys.begin(), keys.end(), key) == keys.end()) keys.push_back(key);
    }
    return helper + "::spreadAttrs(array_diff_key((array) (" + source + "), [" + str_join(keys, ", ") + "]))";
}

// ============================================================================
// checked / selected / disabled
// ============================================================================

static bool compile_boolean_attribute(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    const Node& n = ctx.store.get(node);
    std::string code = "<?= " + ctx.config->runtime_class("HtmlAttributeHelper") +
        "::booleanAttribute('" + n.name + "', " + n.expression + ") ?>";
    out->push_back(raw_code_at(ctx, code, node));
    return true;
}

// ============================================================================
// tag
// ============================================================================

static std::string tag_validation(const CompilationContext& ctx, const std::string& var,
                                  const std::string& expression) {
    return var + " = " + ctx.config->runtime_class("HtmlTagHelper") + "::validateTagName(" + expression + ");";
}

// <div s:tag="$level"> -> validation code, then the element with a runtime tag
static NodeId extract_tag(NodeId element, const std::string& expression, CompilationContext& ctx) {
    NodeStore& store = ctx.store;
    std::string var = unique_variable("tag", expression, store, element);
    const Node& el = store.get(element);

    NodeId validation = store.make_raw_code(tag_validation(ctx, var, expression), el.line, el.column);
    NodeId tagged = store.clone_with(element, el.attributes, el.children);
    store.get(tagged).dynamic_tag = var;

    NodeId fragment = store.make_fragment(el.line, el.column);
    store.append_child(fragment, validation);
    store.append_child(fragment, tagged);
    return fragment;
}

static bool compile_tag(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    const Node& n = ctx.store.get(node);
    std::string var = unique_variable("tag", n.expression, ctx.store, node);
    out->push_back(raw_code_at(ctx, tag_validation(ctx, var, n.expression), node));
    return true;
}

// ============================================================================
// Registration
// ============================================================================

void register_attribute_directives(DirectiveRegistry& registry) {
    DirectiveDef def = make_directive("class", DirectiveType::ATTRIBUTE, compile_class,
        "compose the class attribute from a list or map");
    def.merge_mode = AttributeMergeMode::MERGE_NAMED;
    def.merge_target = "class";
    def.merge_named = merge_class;
    registry.define(def);

    def = make_directive("spread", DirectiveType::ATTRIBUTE, compile_spread,
        "write every entry of a map as an attribute");
    def.merge_mode = AttributeMergeMode::EXCLUDE_NAMED;
    def.exclude_named = spread_excluding;
    registry.define(def);
    def.name = "attr";
    registry.define(def);

    const char* booleans[] = {"checked", "selected", "disabled"};
    for (const char* name : booleans) {
        registry.define(make_directive(name, DirectiveType::ATTRIBUTE, compile_boolean_attribute,
            "write the attribute when the expression is truthy"));
    }

    def = make_directive("tag", DirectiveType::ATTRIBUTE, compile_tag,
        "choose the element name at runtime");
    def.extract = extract_tag;
    registry.define(def);
}

} // namespace glaze

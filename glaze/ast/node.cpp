#include "node.hpp"
#include "../str_util.hpp"

namespace glaze {

const char* node_type_name(NodeType type) {
    switch (type) {
    case NodeType::DOCUMENT:  return "Document";
    case NodeType::ELEMENT:   return "Element";
    case NodeType::COMPONENT: return "Component";
    case NodeType::FRAGMENT:  return "Fragment";
    case NodeType::DIRECTIVE: return "Directive";
    case NodeType::TEXT:      return "Text";
    case NodeType::OUTPUT:    return "Output";
    case NodeType::RAW_CODE:  return "RawCode";
    case NodeType::RAW_BODY:  return "RawBody";
    }
    return "Unknown";
}

const char* output_context_name(OutputContext context) {
    switch (context) {
    case OutputContext::HTML:           return "html";
    case OutputContext::HTML_ATTRIBUTE: return "html_attribute";
    case OutputContext::JAVASCRIPT:     return "javascript";
    case OutputContext::CSS:            return "css";
    case OutputContext::URL:            return "url";
    case OutputContext::JSON:           return "json";
    case OutputContext::JSON_ATTRIBUTE: return "json_attribute";
    case OutputContext::RAW:            return "raw";
    }
    return "unknown";
}

// ============================================================================
// AttributeValue
// ============================================================================

AttributeValue AttributeValue::boolean() {
    return AttributeValue();
}

AttributeValue AttributeValue::of_static(const std::string& text) {
    AttributeValue v;
    v.kind_ = AttributeValueKind::STATIC;
    v.text_ = text;
    return v;
}

AttributeValue AttributeValue::of_output(NodeId output) {
    AttributeValue v;
    v.kind_ = AttributeValueKind::OUTPUT;
    v.output_ = output;
    return v;
}

AttributeValue AttributeValue::of_parts(std::vector<AttributePart> parts) {
    AttributeValue v;
    v.kind_ = AttributeValueKind::PARTS;
    v.parts_ = std::move(parts);
    v.normalize();
    return v;
}

void AttributeValue::normalize() {
    if (kind_ != AttributeValueKind::PARTS) return;

    // merge adjacent literals, drop empty ones
    std::vector<AttributePart> merged;
    for (AttributePart& part : parts_) {
        if (!part.is_output) {
            if (part.text.empty()) continue;
            if (!merged.empty() && !merged.back().is_output) {
                merged.back().text += part.text;
                continue;
            }
        }
        merged.push_back(std::move(part));
    }
    parts_.swap(merged);

    if (parts_.empty()) {
        kind_ = AttributeValueKind::STATIC;
        text_.clear();
    } else if (parts_.size() == 1) {
        if (parts_[0].is_output) {
            kind_ = AttributeValueKind::OUTPUT;
            output_ = parts_[0].output;
        } else {
            kind_ = AttributeValueKind::STATIC;
            text_ = parts_[0].text;
        }
        parts_.clear();
    }
}

bool AttributeValue::to_parts(std::vector<AttributePart>* out) const {
    out->clear();
    switch (kind_) {
    case AttributeValueKind::BOOLEAN:
        return false;
    case AttributeValueKind::STATIC:
        out->push_back(AttributePart::literal(text_));
        return true;
    case AttributeValueKind::OUTPUT:
        out->push_back(AttributePart::dynamic(output_));
        return true;
    case AttributeValueKind::PARTS:
        *out = parts_;
        return true;
    }
    return false;
}

void AttributeValue::append_text(const std::string& text) {
    if (kind_ == AttributeValueKind::BOOLEAN) {
        *this = of_static(text);
        return;
    }
    std::vector<AttributePart> parts;
    to_parts(&parts);
    parts.push_back(AttributePart::literal(text));
    *this = of_parts(std::move(parts));
}

void AttributeValue::append_output(NodeId output) {
    if (kind_ == AttributeValueKind::BOOLEAN) {
        *this = of_output(output);
        return;
    }
    std::vector<AttributePart> parts;
    to_parts(&parts);
    parts.push_back(AttributePart::dynamic(output));
    *this = of_parts(std::move(parts));
}

bool AttributeValue::has_output() const {
    if (kind_ == AttributeValueKind::OUTPUT) return true;
    for (const AttributePart& part : parts_) {
        if (part.is_output) return true;
    }
    return false;
}

// ============================================================================
// NodeStore
// ============================================================================

NodeId NodeStore::create(NodeType type, uint32_t line, uint32_t column) {
    nodes_.emplace_back();
    Node& node = nodes_.back();
    node.type = type;
    node.line = line;
    node.column = column;
    return (NodeId)(nodes_.size() - 1);
}

NodeId NodeStore::make_document() {
    return create(NodeType::DOCUMENT, 1, 1);
}

NodeId NodeStore::make_text(const std::string& text, uint32_t line, uint32_t column) {
    NodeId id = create(NodeType::TEXT, line, column);
    get(id).text = text;
    return id;
}

NodeId NodeStore::make_output(const std::string& expression, bool escape, OutputContext context,
                              uint32_t line, uint32_t column) {
    NodeId id = create(NodeType::OUTPUT, line, column);
    Node& node = get(id);
    node.expression = expression;
    node.escape = escape;
    node.context = context;
    return id;
}

NodeId NodeStore::make_raw_code(const std::string& code, uint32_t line, uint32_t column) {
    NodeId id = create(NodeType::RAW_CODE, line, column);
    get(id).text = code;
    return id;
}

NodeId NodeStore::make_raw_body(const std::string& body, uint32_t line, uint32_t column) {
    NodeId id = create(NodeType::RAW_BODY, line, column);
    get(id).text = body;
    return id;
}

NodeId NodeStore::make_element(const std::string& tag, uint32_t line, uint32_t column) {
    NodeId id = create(NodeType::ELEMENT, line, column);
    get(id).tag = tag;
    return id;
}

NodeId NodeStore::make_component(const std::string& name, uint32_t line, uint32_t column) {
    NodeId id = create(NodeType::COMPONENT, line, column);
    get(id).tag = name;
    return id;
}

NodeId NodeStore::make_fragment(uint32_t line, uint32_t column) {
    return create(NodeType::FRAGMENT, line, column);
}

NodeId NodeStore::make_directive(const std::string& name, const std::string& expression,
                                 uint32_t line, uint32_t column) {
    NodeId id = create(NodeType::DIRECTIVE, line, column);
    Node& node = get(id);
    node.name = name;
    node.expression = expression;
    return id;
}

void NodeStore::append_child(NodeId parent, NodeId child) {
    get(parent).children.push_back(child);
    get(child).parent = parent;
}

void NodeStore::set_children(NodeId parent, const std::vector<NodeId>& children) {
    get(parent).children = children;
    for (NodeId child : children) get(child).parent = parent;
}

void NodeStore::set_else_children(NodeId directive, const std::vector<NodeId>& children) {
    get(directive).else_children = children;
    for (NodeId child : children) get(child).parent = directive;
}

NodeId NodeStore::clone_shallow(NodeId id) {
    Node copy = get(id);
    copy.parent = NO_NODE;
    nodes_.push_back(std::move(copy));
    return (NodeId)(nodes_.size() - 1);
}

AttributeValue NodeStore::clone_value(const AttributeValue& value) {
    switch (value.kind()) {
    case AttributeValueKind::BOOLEAN:
    case AttributeValueKind::STATIC:
        return value;
    case AttributeValueKind::OUTPUT:
        return AttributeValue::of_output(clone_deep(value.output()));
    case AttributeValueKind::PARTS: {
        std::vector<AttributePart> parts = value.parts();
        for (AttributePart& part : parts) {
            if (part.is_output) part.output = clone_deep(part.output);
        }
        return AttributeValue::of_parts(std::move(parts));
    }
    }
    return value;
}

NodeId NodeStore::clone_deep(NodeId id) {
    NodeId copy = clone_shallow(id);
    {
        Node& node = get(copy);
        node.paired = NO_NODE;
        node.paired_from = NO_NODE;
        node.consumed = false;
    }

    std::vector<AttributeNode> attributes = get(copy).attributes;
    for (AttributeNode& attr : attributes) attr.value = clone_value(attr.value);
    get(copy).attributes = attributes;

    set_children(copy, clone_deep(get(id).children));
    if (!get(id).else_children.empty()) {
        set_else_children(copy, clone_deep(get(id).else_children));
    }
    if (get(id).element_meta != NO_NODE) {
        get(copy).element_meta = clone_deep(get(id).element_meta);
    }
    return copy;
}

std::vector<NodeId> NodeStore::clone_deep(const std::vector<NodeId>& ids) {
    std::vector<NodeId> out;
    out.reserve(ids.size());
    for (NodeId id : ids) out.push_back(clone_deep(id));
    return out;
}

NodeId NodeStore::clone_with(NodeId id, const std::vector<AttributeNode>& attributes,
                             const std::vector<NodeId>& children) {
    NodeId copy = clone_shallow(id);
    get(copy).attributes = attributes;
    set_children(copy, children);
    return copy;
}

// ============================================================================
// Attribute helpers
// ============================================================================

const AttributeNode* find_attribute(const std::vector<AttributeNode>& attributes, const std::string& name) {
    for (const AttributeNode& attr : attributes) {
        if (attr.name == name) return &attr;
    }
    return nullptr;
}

int find_attribute_index(const std::vector<AttributeNode>& attributes, const std::string& name) {
    for (size_t i = 0; i < attributes.size(); i++) {
        if (attributes[i].name == name) return (int)i;
    }
    return -1;
}

std::vector<std::string> collect_named_attribute_names(const std::vector<AttributeNode>& attributes) {
    std::vector<std::string> names;
    for (const AttributeNode& attr : attributes) {
        if (attr.name.empty()) continue;
        bool seen = false;
        for (const std::string& n : names) {
            if (n == attr.name) { seen = true; break; }
        }
        if (!seen) names.push_back(attr.name);
    }
    return names;
}

std::string attribute_value_to_expression(const NodeStore& store, const AttributeValue& value,
                                          bool wrap_outputs, const char* boolean_literal) {
    auto output_expr = [&](NodeId id) {
        const std::string& expr = store.get(id).expression;
        return wrap_outputs ? "(" + expr + ")" : expr;
    };

    switch (value.kind()) {
    case AttributeValueKind::BOOLEAN:
        return boolean_literal;
    case AttributeValueKind::STATIC:
        return php_quote(value.static_text());
    case AttributeValueKind::OUTPUT:
        return output_expr(value.output());
    case AttributeValueKind::PARTS: {
        std::vector<std::string> pieces;
        for (const AttributePart& part : value.parts()) {
            pieces.push_back(part.is_output ? output_expr(part.output) : php_quote(part.text));
        }
        return pieces.empty() ? "''" : str_join(pieces, " . ");
    }
    }
    return "''";
}

bool is_whitespace_text(const NodeStore& store, NodeId id) {
    const Node& node = store.get(id);
    return node.is(NodeType::TEXT) && str_is_blank(node.text);
}

} // namespace glaze

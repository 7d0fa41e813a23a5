/**
 * @file node.hpp
 * @brief Template syntax tree: nodes, attribute values and the node store
 *
 * All nodes of one compile live in a NodeStore and refer to each other by
 * NodeId. Children lists own nothing; parent, paired-sibling and captured
 * element links are plain ids used for traversal and diagnostics. Nodes that
 * a pass detaches stay valid in the store until the compile ends.
 */

#ifndef GLAZE_AST_NODE_HPP
#define GLAZE_AST_NODE_HPP

#include <stdint.h>
#include <deque>
#include <string>
#include <vector>

namespace glaze {

typedef uint32_t NodeId;
static const NodeId NO_NODE = UINT32_MAX;

// ============================================================================
// Node kinds
// ============================================================================

enum class NodeType : uint8_t {
    DOCUMENT,       // root, owns the top-level children
    ELEMENT,        // markup element, static or dynamic tag
    COMPONENT,      // <s-name>, expanded by a later stage
    FRAGMENT,       // attribute carrier without a rendered wrapper tag
    DIRECTIVE,      // extracted s:name="expression"
    TEXT,           // literal markup text
    OUTPUT,         // dynamic expression, escaped per context
    RAW_CODE,       // opaque host code, emitted as a code block
    RAW_BODY,       // opaque markup from a raw region
};

const char* node_type_name(NodeType type);

enum class OutputContext : uint8_t {
    HTML,
    HTML_ATTRIBUTE,
    JAVASCRIPT,
    CSS,
    URL,
    JSON,
    JSON_ATTRIBUTE,
    RAW,
};

const char* output_context_name(OutputContext context);

// ============================================================================
// Attribute values
// ============================================================================

enum class AttributeValueKind : uint8_t {
    BOOLEAN,        // presence only: <input disabled>
    STATIC,         // literal text
    OUTPUT,         // exactly one dynamic expression
    PARTS,          // ordered mix of literals and expressions
};

struct AttributePart {
    bool is_output = false;
    std::string text;           // literal, when !is_output
    NodeId output = NO_NODE;    // OUTPUT node, when is_output

    static AttributePart literal(const std::string& s) { AttributePart p; p.text = s; return p; }
    static AttributePart dynamic(NodeId id) { AttributePart p; p.is_output = true; p.output = id; return p; }
};

// Always kept in its simplest shape: a single-part PARTS value collapses to
// STATIC or OUTPUT, and an empty part list becomes STATIC "". Every factory
// and mutator normalizes.
class AttributeValue {
public:
    AttributeValue() = default;

    static AttributeValue boolean();
    static AttributeValue of_static(const std::string& text);
    static AttributeValue of_output(NodeId output);
    static AttributeValue of_parts(std::vector<AttributePart> parts);

    AttributeValueKind kind() const { return kind_; }
    bool is_boolean() const { return kind_ == AttributeValueKind::BOOLEAN; }
    bool is_static() const { return kind_ == AttributeValueKind::STATIC; }
    bool is_output() const { return kind_ == AttributeValueKind::OUTPUT; }
    bool is_parts() const { return kind_ == AttributeValueKind::PARTS; }

    const std::string& static_text() const { return text_; }
    NodeId output() const { return output_; }
    const std::vector<AttributePart>& parts() const { return parts_; }

    // false for BOOLEAN, else the value as an ordered part list
    bool to_parts(std::vector<AttributePart>* out) const;

    void append_text(const std::string& text);
    void append_output(NodeId output);

    // true when any part is dynamic
    bool has_output() const;

private:
    void normalize();

    AttributeValueKind kind_ = AttributeValueKind::BOOLEAN;
    std::string text_;
    NodeId output_ = NO_NODE;
    std::vector<AttributePart> parts_;
};

struct AttributeNode {
    std::string name;           // empty for spread output (<?= spreadAttrs(...) ?>)
    AttributeValue value;
    uint32_t line = 0;
    uint32_t column = 0;
};

// ============================================================================
// Node
// ============================================================================

struct Node {
    NodeType type = NodeType::TEXT;
    uint32_t line = 0;
    uint32_t column = 0;
    NodeId parent = NO_NODE;

    // DOCUMENT, ELEMENT, COMPONENT, FRAGMENT, DIRECTIVE (primary branch)
    std::vector<NodeId> children;

    // ELEMENT tag, COMPONENT name
    std::string tag;
    // ELEMENT: variable holding a runtime tag name, e.g. "$__tag_1a2b3c4d"
    std::string dynamic_tag;
    std::vector<AttributeNode> attributes;
    bool self_closing = false;

    // DIRECTIVE
    std::string name;
    std::vector<NodeId> else_children;  // alternate branch built without pairing
    NodeId paired = NO_NODE;            // next member of the paired chain
    NodeId paired_from = NO_NODE;       // previous member of the paired chain
    bool consumed = false;              // compiled by the head of its chain
    NodeId element_meta = NO_NODE;      // captured host element (custom extraction)

    // DIRECTIVE and OUTPUT
    std::string expression;

    // OUTPUT
    bool escape = true;
    OutputContext context = OutputContext::HTML;
    bool context_explicit = false;      // set by a pipe marker, never overridden
    std::vector<std::string> pipes;     // filter stages, applied in order

    // TEXT, RAW_CODE, RAW_BODY
    std::string text;

    bool is(NodeType t) const { return type == t; }
    bool is_container() const {
        return type == NodeType::DOCUMENT || type == NodeType::ELEMENT ||
               type == NodeType::COMPONENT || type == NodeType::FRAGMENT ||
               type == NodeType::DIRECTIVE;
    }
};

// ============================================================================
// NodeStore
// ============================================================================

// Arena of nodes for one compile. Backed by a deque so that references
// returned by get() survive later create() calls.
class NodeStore {
public:
    NodeId create(NodeType type, uint32_t line, uint32_t column);

    Node& get(NodeId id) { return nodes_[id]; }
    const Node& get(NodeId id) const { return nodes_[id]; }
    bool valid(NodeId id) const { return id != NO_NODE && id < nodes_.size(); }
    size_t size() const { return nodes_.size(); }
    void clear() { nodes_.clear(); }

    // ---- factories ----
    NodeId make_document();
    NodeId make_text(const std::string& text, uint32_t line, uint32_t column);
    NodeId make_output(const std::string& expression, bool escape, OutputContext context,
                       uint32_t line, uint32_t column);
    NodeId make_raw_code(const std::string& code, uint32_t line, uint32_t column);
    NodeId make_raw_body(const std::string& body, uint32_t line, uint32_t column);
    NodeId make_element(const std::string& tag, uint32_t line, uint32_t column);
    NodeId make_component(const std::string& name, uint32_t line, uint32_t column);
    NodeId make_fragment(uint32_t line, uint32_t column);
    NodeId make_directive(const std::string& name, const std::string& expression,
                          uint32_t line, uint32_t column);

    // ---- structure ----
    void append_child(NodeId parent, NodeId child);
    void set_children(NodeId parent, const std::vector<NodeId>& children);
    void set_else_children(NodeId directive, const std::vector<NodeId>& children);

    // copy of `id` with the same attributes and children list (children shared)
    NodeId clone_shallow(NodeId id);
    // recursive copy, attribute outputs included; links are not carried over
    NodeId clone_deep(NodeId id);
    std::vector<NodeId> clone_deep(const std::vector<NodeId>& ids);

    // copy of element `id` with replaced attributes and children
    NodeId clone_with(NodeId id, const std::vector<AttributeNode>& attributes,
                      const std::vector<NodeId>& children);

private:
    AttributeValue clone_value(const AttributeValue& value);

    std::deque<Node> nodes_;
};

// ============================================================================
// Attribute helpers
// ============================================================================

const AttributeNode* find_attribute(const std::vector<AttributeNode>& attributes, const std::string& name);
int find_attribute_index(const std::vector<AttributeNode>& attributes, const std::string& name);
// named attributes in first-seen order, spread entries skipped
std::vector<std::string> collect_named_attribute_names(const std::vector<AttributeNode>& attributes);

// host-code expression yielding the attribute's value:
// static -> quoted literal, output -> expression, parts -> joined with " . "
std::string attribute_value_to_expression(const NodeStore& store, const AttributeValue& value,
                                          bool wrap_outputs = false, const char* boolean_literal = "true");

bool is_whitespace_text(const NodeStore& store, NodeId id);

} // namespace glaze

#endif // GLAZE_AST_NODE_HPP

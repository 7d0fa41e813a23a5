/**
 * @file directive.hpp
 * @brief Directive descriptors: compile callback plus optional capabilities
 *
 * A directive is described by a DirectiveDef rather than a class hierarchy.
 * Every optional capability is an explicit field, so the extraction, pairing
 * and compilation passes read what a directive can do instead of probing
 * its type:
 *
 *   pairs_with          sibling directives that contribute an alternate branch
 *   follows             directives this one must be paired to (else, finally)
 *   enclosing           directive that must contain this one (case, default)
 *   claim_attribute     <s-NAME attr="..."> reads the expression from `attr`
 *   extract             custom extraction from the host element
 *   merge_mode          how an emitted attribute composes with existing ones
 *   wraps_content       content modifier (nowrap) instead of a directive
 */

#ifndef GLAZE_DIRECTIVE_HPP
#define GLAZE_DIRECTIVE_HPP

#include <stdint.h>
#include <string>
#include <vector>

#include "../ast/node.hpp"

namespace glaze {

struct CompilationContext;

// ============================================================================
// Directive Types
// ============================================================================

enum class DirectiveType : uint8_t {
    CONTROL_FLOW,   // wraps children in a generated control structure
    ATTRIBUTE,      // rewrites into an attribute on the host element
    CONTENT,        // replaces the host element's body with one output
    PASS_THROUGH,   // accepted by validation, consumed by another stage
};

const char* directive_type_name(DirectiveType type);

enum class AttributeMergeMode : uint8_t {
    REPLACE,        // appended as a new attribute
    MERGE_NAMED,    // combined with the same-named attribute via merge_named
    EXCLUDE_NAMED,  // spread output skips names already on the element
};

// ============================================================================
// Callbacks
// ============================================================================

// Appends the replacement for directive `node` to *out. Returns false after
// recording an error on ctx.
typedef bool (*DirectiveCompileFn)(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out);

// Custom extraction. `element` is a clone of the host element that no longer
// carries the directive attribute. Returns the node that takes its place:
// an element to keep extracting from, a fragment whose non-element children
// are emitted before its element, or a directive. NO_NODE on error.
typedef NodeId (*DirectiveExtractFn)(NodeId element, const std::string& expression, CompilationContext& ctx);

// MERGE_NAMED: expression combining the existing and incoming values
typedef std::string (*MergeNamedFn)(const CompilationContext& ctx, const std::string& existing,
                                    const std::string& incoming);

// EXCLUDE_NAMED: spread expression over `source` without `names`
typedef std::string (*ExcludeNamedFn)(const CompilationContext& ctx, const std::string& source,
                                      const std::vector<std::string>& names);

// ============================================================================
// Directive Definition
// ============================================================================

struct DirectiveDef {
    std::string name;                       // without prefix: "if", "foreach"
    DirectiveType type = DirectiveType::CONTROL_FLOW;
    DirectiveCompileFn compile = nullptr;

    std::vector<std::string> pairs_with;
    std::vector<std::string> follows;
    std::string enclosing;
    std::string claim_attribute;
    DirectiveExtractFn extract = nullptr;

    AttributeMergeMode merge_mode = AttributeMergeMode::REPLACE;
    std::string merge_target;               // MERGE_NAMED target attribute
    MergeNamedFn merge_named = nullptr;
    ExcludeNamedFn exclude_named = nullptr;

    bool wraps_content = false;             // modifier of text/html
    bool keep_wrapper = true;               // modifier: emit the host element

    const char* description = "";

    bool is_paired() const { return !pairs_with.empty(); }
    bool pairs_with_name(const std::string& other) const;
    bool claims_element() const { return !claim_attribute.empty(); }
    bool has_custom_extraction() const { return extract != nullptr; }
};

} // namespace glaze

#endif // GLAZE_DIRECTIVE_HPP

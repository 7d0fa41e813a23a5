/**
 * @file pipeline.hpp
 * @brief Ordered AST passes with a depth-first node-action protocol
 *
 * For every node, each pass's before() hook runs in priority order, then the
 * node's children are walked (starting again from the first pass), then the
 * after() hooks run. A hook answers with a NodeAction:
 *
 *   NONE            keep going
 *   SKIP_CHILDREN   do not descend into this node (before() only)
 *   REPLACE         splice zero or more nodes in place of this one; they are
 *                   walked starting at the same pass when `restart` is set,
 *                   otherwise at the next pass
 *   FAIL            stop; the hook has recorded the error on the context
 *
 * Passes are ordered by (priority, sequence). Replacement chains are driven
 * by a worklist; each chain (a node, its replacements, their replacements)
 * is capped by Config::max_rewrites, tree depth by Config::max_depth.
 */

#ifndef GLAZE_PIPELINE_HPP
#define GLAZE_PIPELINE_HPP

#include <stdint.h>
#include <memory>
#include <string>
#include <vector>

#include "context.hpp"

namespace glaze {

// ============================================================================
// NodeAction
// ============================================================================

enum class ActionKind : uint8_t {
    NONE,
    SKIP_CHILDREN,
    REPLACE,
    FAIL,
};

struct NodeAction {
    ActionKind kind = ActionKind::NONE;
    std::vector<NodeId> nodes;      // REPLACE only
    bool restart = false;           // REPLACE only

    static NodeAction none() { return NodeAction(); }
    static NodeAction skip_children() { NodeAction a; a.kind = ActionKind::SKIP_CHILDREN; return a; }
    static NodeAction fail() { NodeAction a; a.kind = ActionKind::FAIL; return a; }
    static NodeAction replace(std::vector<NodeId> nodes, bool restart = false) {
        NodeAction a;
        a.kind = ActionKind::REPLACE;
        a.nodes = std::move(nodes);
        a.restart = restart;
        return a;
    }
};

// ============================================================================
// PipelineContext
// ============================================================================

enum class ChildList : uint8_t {
    CHILDREN,
    ELSE_CHILDREN,
};

struct PipelineContext {
    CompilationContext& compilation;
    NodeId parent;          // NO_NODE for the document
    ChildList list;         // which list of `parent` holds the node
    size_t index;           // position in that list before this walk
    uint32_t depth;

    // the list holding the node, as it was before its siblings were walked
    const std::vector<NodeId>* siblings() const;
};

// ============================================================================
// AstPass
// ============================================================================

class AstPass {
public:
    virtual ~AstPass() {}
    virtual const char* name() const = 0;
    virtual NodeAction before(NodeId node, PipelineContext& context) {
        (void)node; (void)context;
        return NodeAction::none();
    }
    virtual NodeAction after(NodeId node, PipelineContext& context) {
        (void)node; (void)context;
        return NodeAction::none();
    }
};

// ============================================================================
// Pipeline
// ============================================================================

class Pipeline {
public:
    void add_pass(std::unique_ptr<AstPass> pass, int priority = 0);
    // same priority as the anchor, ordered directly before/after it;
    // false when no pass is named `anchor`
    bool add_pass_before(const char* anchor, std::unique_ptr<AstPass> pass);
    bool add_pass_after(const char* anchor, std::unique_ptr<AstPass> pass);

    // pass names in execution order
    std::vector<std::string> pass_names() const;
    size_t pass_count() const { return entries_.size(); }

    // NO_NODE when a pass failed or the result is not a single document
    NodeId execute(NodeId document, CompilationContext& ctx);

private:
    struct Entry {
        std::unique_ptr<AstPass> pass;
        int priority;
        int sequence;
    };

    struct Step {
        bool replaced = false;
        std::vector<NodeId> nodes;
        size_t start = 0;
    };

    int find_entry(const char* name) const;
    void insert_at(int anchor_index, bool after, std::unique_ptr<AstPass> pass);
    void sort_entries();

    bool walk(NodeId node, NodeId parent, ChildList list, size_t index, size_t start,
              uint32_t depth, std::vector<NodeId>* out);
    bool walk_node(NodeId node, NodeId parent, ChildList list, size_t index, size_t start,
                   uint32_t depth, Step* step);
    bool walk_list(NodeId node, ChildList list, uint32_t depth);
    bool check_action(const NodeAction& action);

    std::vector<Entry> entries_;
    int next_sequence_ = 0;
    CompilationContext* ctx_ = nullptr;
    uint32_t rewrites_ = 0;
};

} // namespace glaze

#endif // GLAZE_PIPELINE_HPP

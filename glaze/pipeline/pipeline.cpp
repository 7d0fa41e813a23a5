#include "pipeline.hpp"
#include "../../lib/log.h"

#include <stdio.h>
#include <string.h>
#include <algorithm>
#include <deque>

namespace glaze {

const std::vector<NodeId>* PipelineContext::siblings() const {
    if (parent == NO_NODE) return nullptr;
    const Node& p = compilation.store.get(parent);
    return list == ChildList::CHILDREN ? &p.children : &p.else_children;
}

// ============================================================================
// Registration
// ============================================================================

void Pipeline::add_pass(std::unique_ptr<AstPass> pass, int priority) {
    Entry entry;
    entry.pass = std::move(pass);
    entry.priority = priority;
    entry.sequence = next_sequence_++;
    entries_.push_back(std::move(entry));
    sort_entries();
}

int Pipeline::find_entry(const char* name) const {
    for (size_t i = 0; i < entries_.size(); i++) {
        if (strcmp(entries_[i].pass->name(), name) == 0) return (int)i;
    }
    return -1;
}

void Pipeline::insert_at(int anchor_index, bool after, std::unique_ptr<AstPass> pass) {
    int anchor_seq = entries_[anchor_index].sequence;
    int new_seq = after ? anchor_seq + 1 : anchor_seq;
    // open a gap in the sequence numbers at new_seq
    for (Entry& e : entries_) {
        if (e.sequence >= new_seq) e.sequence++;
    }
    Entry entry;
    entry.pass = std::move(pass);
    entry.priority = entries_[anchor_index].priority;
    entry.sequence = new_seq;
    entries_.push_back(std::move(entry));
    next_sequence_++;
    sort_entries();
}

bool Pipeline::add_pass_before(const char* anchor, std::unique_ptr<AstPass> pass) {
    int index = find_entry(anchor);
    if (index < 0) {
        log_warn("glaze pipeline: no pass named %s to insert before", anchor);
        return false;
    }
    insert_at(index, false, std::move(pass));
    return true;
}

bool Pipeline::add_pass_after(const char* anchor, std::unique_ptr<AstPass> pass) {
    int index = find_entry(anchor);
    if (index < 0) {
        log_warn("glaze pipeline: no pass named %s to insert after", anchor);
        return false;
    }
    insert_at(index, true, std::move(pass));
    return true;
}

void Pipeline::sort_entries() {
    std::sort(entries_.begin(), entries_.end(), [](const Entry& a, const Entry& b) {
        if (a.priority != b.priority) return a.priority < b.priority;
        return a.sequence < b.sequence;
    });
}

std::vector<std::string> Pipeline::pass_names() const {
    std::vector<std::string> names;
    for (const Entry& e : entries_) names.push_back(e.pass->name());
    return names;
}

// ============================================================================
// Execution
// ============================================================================

NodeId Pipeline::execute(NodeId document, CompilationContext& ctx) {
    ctx_ = &ctx;
    rewrites_ = 0;

    if (log_level_enabled(log_default_category, LOG_LEVEL_DEBUG)) {
        std::string order;
        for (const Entry& e : entries_) {
            char item[96];
            snprintf(item, sizeof(item), "%s%s(%d)", order.empty() ? "" : ", ", e.pass->name(), e.priority);
            order += item;
        }
        log_debug("glaze pipeline: passes %s", order.c_str());
    }

    std::vector<NodeId> result;
    bool ok = walk(document, NO_NODE, ChildList::CHILDREN, 0, 0, 0, &result);
    ctx_ = nullptr;
    if (!ok) return NO_NODE;

    if (result.size() != 1 || !ctx.store.get(result[0]).is(NodeType::DOCUMENT)) {
        ctx.fail(ERR_PIPELINE_RESULT, "Pipeline must return a single document node", 0, 0);
        return NO_NODE;
    }
    log_debug("glaze pipeline: done after %u rewrites", rewrites_);
    return result[0];
}

bool Pipeline::check_action(const NodeAction& action) {
    if (action.kind != ActionKind::FAIL) return true;
    if (!ctx_->failed()) {
        ctx_->fail(ERR_INVALID_STATE, "A compiler pass failed without reporting an error", 0, 0);
    }
    return false;
}

bool Pipeline::walk(NodeId node, NodeId parent, ChildList list, size_t index, size_t start,
                    uint32_t depth, std::vector<NodeId>* out) {
    // chain: replacements that led from the original node to this one
    struct WorkItem {
        NodeId node;
        size_t start;
        uint32_t chain;
    };
    std::deque<WorkItem> work;
    work.push_back(WorkItem{node, start, 0});
    size_t offset = 0;

    while (!work.empty()) {
        WorkItem item = work.front();
        work.pop_front();

        Step step;
        if (!walk_node(item.node, parent, list, index + offset, item.start, depth, &step)) return false;

        if (!step.replaced) {
            out->push_back(item.node);
            offset++;
            continue;
        }

        rewrites_++;
        if (item.chain + 1 > ctx_->config->max_rewrites) {
            char message[128];
            snprintf(message, sizeof(message),
                "Template rewriting exceeded %u replacements", ctx_->config->max_rewrites);
            return ctx_->fail_at(ERR_REWRITE_LIMIT, message, item.node);
        }
        for (auto it = step.nodes.rbegin(); it != step.nodes.rend(); ++it) {
            work.push_front(WorkItem{*it, step.start, item.chain + 1});
        }
    }
    return true;
}

bool Pipeline::walk_node(NodeId node, NodeId parent, ChildList list, size_t index, size_t start,
                         uint32_t depth, Step* step) {
    NodeStore& store = ctx_->store;
    store.get(node).parent = parent;
    PipelineContext context{*ctx_, parent, list, index, depth};
    size_t count = entries_.size();
    bool skip_children = false;

    for (size_t i = start; i < count; i++) {
        NodeAction action = entries_[i].pass->before(node, context);
        if (!check_action(action)) return false;
        if (action.kind == ActionKind::REPLACE) {
            step->replaced = true;
            step->nodes = std::move(action.nodes);
            step->start = action.restart ? i : i + 1;
            return true;
        }
        if (action.kind == ActionKind::SKIP_CHILDREN) skip_children = true;
    }

    if (!skip_children && store.get(node).is_container()) {
        if (depth + 1 > ctx_->config->max_depth) {
            char message[128];
            snprintf(message, sizeof(message),
                "Template nesting exceeds the maximum depth of %u", ctx_->config->max_depth);
            return ctx_->fail_at(ERR_NESTING_TOO_DEEP, message, node);
        }
        if (!walk_list(node, ChildList::CHILDREN, depth + 1)) return false;
        if (!walk_list(node, ChildList::ELSE_CHILDREN, depth + 1)) return false;
    }

    for (size_t i = start; i < count; i++) {
        NodeAction action = entries_[i].pass->after(node, context);
        if (!check_action(action)) return false;
        if (action.kind == ActionKind::REPLACE) {
            step->replaced = true;
            step->nodes = std::move(action.nodes);
            step->start = action.restart ? i : i + 1;
            return true;
        }
    }
    return true;
}

bool Pipeline::walk_list(NodeId node, ChildList list, uint32_t depth) {
    NodeStore& store = ctx_->store;
    std::vector<NodeId> original = list == ChildList::CHILDREN
        ? store.get(node).children : store.get(node).else_children;
    if (original.empty()) return true;

    std::vector<NodeId> result;
    for (size_t i = 0; i < original.size(); i++) {
        if (!walk(original[i], node, list, i, 0, depth, &result)) return false;
    }

    if (list == ChildList::CHILDREN) store.set_children(node, result);
    else store.set_else_children(node, result);
    return true;
}

} // namespace glaze

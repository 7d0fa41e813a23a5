#include "registry.hpp"
#include "../../lib/log.h"

namespace glaze {

const char* directive_type_name(DirectiveType type) {
    switch (type) {
    case DirectiveType::CONTROL_FLOW: return "control-flow";
    case DirectiveType::ATTRIBUTE: return "attribute";
    case DirectiveType::CONTENT: return "content";
    case DirectiveType::PASS_THROUGH: return "pass-through";
    }
    return "unknown";
}

bool DirectiveDef::pairs_with_name(const std::string& other) const {
    for (const std::string& name : pairs_with) {
        if (name == other) return true;
    }
    return false;
}

DirectiveRegistry DirectiveRegistry::with_defaults() {
    DirectiveRegistry registry;
    register_control_flow_directives(registry);
    register_loop_directives(registry);
    register_attribute_directives(registry);
    register_content_directives(registry);
    log_debug("glaze registry: %zu built-in directives", registry.size());
    return registry;
}

void DirectiveRegistry::define(const DirectiveDef& def) {
    auto it = index_.find(def.name);
    if (it != index_.end()) {
        defs_[it->second] = def;
        return;
    }
    // a removed slot with the same name is reused
    for (size_t i = 0; i < defs_.size(); i++) {
        if (!live_[i] && defs_[i].name == def.name) {
            defs_[i] = def;
            live_[i] = true;
            index_[def.name] = i;
            return;
        }
    }
    defs_.push_back(def);
    live_.push_back(true);
    index_[def.name] = defs_.size() - 1;
}

bool DirectiveRegistry::remove(const std::string& name) {
    auto it = index_.find(name);
    if (it == index_.end()) return false;
    live_[it->second] = false;
    index_.erase(it);
    return true;
}

const DirectiveDef* DirectiveRegistry::lookup(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : &defs_[it->second];
}

std::vector<std::string> DirectiveRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(index_.size());
    for (size_t i = 0; i < defs_.size(); i++) {
        if (live_[i]) out.push_back(defs_[i].name);
    }
    return out;
}

} // namespace glaze

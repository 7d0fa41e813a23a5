// registry.hpp - directive name -> DirectiveDef lookup

#ifndef GLAZE_DIRECTIVE_REGISTRY_HPP
#define GLAZE_DIRECTIVE_REGISTRY_HPP

#include <stddef.h>
#include <string>
#include <unordered_map>
#include <vector>

#include "directive.hpp"

namespace glaze {

class DirectiveRegistry {
public:
    DirectiveRegistry() = default;

    // registry holding every built-in directive
    static DirectiveRegistry with_defaults();

    // Adds or replaces a directive. Replacing keeps the original
    // registration slot, so suggestion order does not change.
    void define(const DirectiveDef& def);
    bool remove(const std::string& name);

    const DirectiveDef* lookup(const std::string& name) const;
    bool has(const std::string& name) const { return lookup(name) != nullptr; }

    // names in registration order (did-you-mean candidates)
    std::vector<std::string> names() const;
    size_t size() const { return index_.size(); }

private:
    std::vector<DirectiveDef> defs_;
    std::vector<bool> live_;
    std::unordered_map<std::string, size_t> index_;
};

// built-in directive groups
void register_control_flow_directives(DirectiveRegistry& registry);
void register_loop_directives(DirectiveRegistry& registry);
void register_attribute_directives(DirectiveRegistry& registry);
void register_content_directives(DirectiveRegistry& registry);

} // namespace glaze

#endif // GLAZE_DIRECTIVE_REGISTRY_HPP

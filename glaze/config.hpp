// config.hpp - compiler configuration (prefixes, void tags, limits)

#ifndef GLAZE_CONFIG_HPP
#define GLAZE_CONFIG_HPP

#include <stdint.h>
#include <string>
#include <vector>

namespace glaze {

struct Config {
    std::string directive_prefix = "s";          // s:if, s:foreach, ...
    std::string element_prefix = "s-";           // <s-button>, <s-ifblock>
    std::string fragment_element = "s-template"; // attribute-only wrapper
    std::string slot_attribute = "slot";
    std::string bind_attribute = "bind";
    std::vector<std::string> self_closing_tags = {
        "area", "base", "br", "col", "embed", "hr", "img", "input",
        "link", "meta", "param", "source", "track", "wbr",
    };
    bool keep_comments = true;
    std::string runtime_namespace = "Sugar\\Core\\Runtime";
    uint32_t max_depth = 256;
    uint32_t max_rewrites = 100000;

    // prefix "x" -> directive "x:", element "x-", fragment "x-template"
    static Config with_prefix(const std::string& prefix);

    // "s:if" -> true ("s:" alone is not a directive)
    bool is_directive(const std::string& name) const;
    // "s:if" -> "if", names without the prefix come back unchanged
    std::string strip_prefix(const std::string& name) const;
    // "if" -> "s:if"
    std::string build_name(const std::string& short_name) const;
    // length of "s:"
    size_t marker_length() const { return directive_prefix.size() + 1; }

    bool has_element_prefix(const std::string& tag) const;
    std::string strip_element_prefix(const std::string& tag) const;
    bool is_fragment(const std::string& tag) const { return tag == fragment_element; }

    bool is_self_closing(const std::string& tag) const;

    // "Sugar\Core\Runtime\<cls>" as written in generated code
    std::string runtime_class(const char* cls) const;
};

} // namespace glaze

#endif // GLAZE_CONFIG_HPP

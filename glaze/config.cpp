#include "config.hpp"
#include "str_util.hpp"

namespace glaze {

Config Config::with_prefix(const std::string& prefix) {
    Config config;
    config.directive_prefix = prefix;
    config.element_prefix = prefix + "-";
    config.fragment_element = config.element_prefix + "template";
    return config;
}

bool Config::is_directive(const std::string& name) const {
    size_t marker = marker_length();
    return name.size() > marker &&
           name.compare(0, directive_prefix.size(), directive_prefix) == 0 &&
           name[directive_prefix.size()] == ':';
}

std::string Config::strip_prefix(const std::string& name) const {
    if (!is_directive(name)) return name;
    return name.substr(marker_length());
}

std::string Config::build_name(const std::string& short_name) const {
    return directive_prefix + ":" + short_name;
}

bool Config::has_element_prefix(const std::string& tag) const {
    return tag.size() > element_prefix.size() && str_starts_with(tag, element_prefix);
}

std::string Config::strip_element_prefix(const std::string& tag) const {
    if (!has_element_prefix(tag)) return tag;
    return tag.substr(element_prefix.size());
}

bool Config::is_self_closing(const std::string& tag) const {
    for (const std::string& t : self_closing_tags) {
        if (str_iequals(t, tag)) return true;
    }
    return false;
}

std::string Config::runtime_class(const char* cls) const {
    return runtime_namespace + "\\" + cls;
}

} // namespace glaze

// escaper.hpp - context-specific escape code for generated output

#ifndef GLAZE_ESCAPER_HPP
#define GLAZE_ESCAPER_HPP

#include <string>

#include "../ast/node.hpp"

namespace glaze {

// `expression` wrapped in the escaper for `context`; RAW returns it unchanged
std::string generate_escape_code(const std::string& expression, OutputContext context);

} // namespace glaze

#endif // GLAZE_ESCAPER_HPP

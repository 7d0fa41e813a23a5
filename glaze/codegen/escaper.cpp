#include "escaper.hpp"

namespace glaze {

#define GLAZE_HTML_FLAGS  "ENT_QUOTES | ENT_HTML5, 'UTF-8'"
#define GLAZE_JSON_FLAGS  "JSON_HEX_TAG | JSON_HEX_AMP"
#define GLAZE_JS_FLAGS    "JSON_HEX_TAG | JSON_HEX_AMP | JSON_HEX_APOS | JSON_HEX_QUOT"

std::string generate_escape_code(const std::string& expression, OutputContext context) {
    switch (context) {
    case OutputContext::HTML:
    case OutputContext::HTML_ATTRIBUTE:
        return "htmlspecialchars((string)(" + expression + "), " GLAZE_HTML_FLAGS ")";
    case OutputContext::JAVASCRIPT:
        return "json_encode(" + expression + ", " GLAZE_JS_FLAGS ")";
    case OutputContext::CSS:
        return "__SugarEscaper::escapeCss((string)(" + expression + "))";
    case OutputContext::JSON:
        return "json_encode(" + expression + ", " GLAZE_JSON_FLAGS ")";
    case OutputContext::JSON_ATTRIBUTE:
        return "htmlspecialchars(json_encode(" + expression + ", " GLAZE_JS_FLAGS "), " GLAZE_HTML_FLAGS ")";
    case OutputContext::URL:
        return "rawurlencode((string)(" + expression + "))";
    case OutputContext::RAW:
        return expression;
    }
    return expression;
}

} // namespace glaze

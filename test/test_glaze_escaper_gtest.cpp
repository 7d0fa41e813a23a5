#include <gtest/gtest.h>
#include "../glaze/codegen/escaper.hpp"
#include <string>

using namespace glaze;

TEST(GlazeEscaper, HtmlAndAttribute) {
    const char* expected = "htmlspecialchars((string)($x), ENT_QUOTES | ENT_HTML5, 'UTF-8')";
    EXPECT_EQ(generate_escape_code("$x", OutputContext::HTML), expected);
    EXPECT_EQ(generate_escape_code("$x", OutputContext::HTML_ATTRIBUTE), expected);
}

TEST(GlazeEscaper, Javascript) {
    EXPECT_EQ(generate_escape_code("$data", OutputContext::JAVASCRIPT),
              "json_encode($data, JSON_HEX_TAG | JSON_HEX_AMP | JSON_HEX_APOS | JSON_HEX_QUOT)");
}

TEST(GlazeEscaper, Css) {
    EXPECT_EQ(generate_escape_code("$color", OutputContext::CSS),
              "__SugarEscaper::escapeCss((string)($color))");
}

TEST(GlazeEscaper, Json) {
    EXPECT_EQ(generate_escape_code("$data", OutputContext::JSON),
              "json_encode($data, JSON_HEX_TAG | JSON_HEX_AMP)");
}

TEST(GlazeEscaper, JsonAttribute) {
    EXPECT_EQ(generate_escape_code("$data", OutputContext::JSON_ATTRIBUTE),
              "htmlspecialchars(json_encode($data, JSON_HEX_TAG | JSON_HEX_AMP | JSON_HEX_APOS | JSON_HEX_QUOT), "
              "ENT_QUOTES | ENT_HTML5, 'UTF-8')");
}

TEST(GlazeEscaper, Url) {
    EXPECT_EQ(generate_escape_code("$q", OutputContext::URL), "rawurlencode((string)($q))");
}

TEST(GlazeEscaper, RawIsUnchanged) {
    EXPECT_EQ(generate_escape_code("$a . $b", OutputContext::RAW), "$a . $b");
}

TEST(GlazeEscaper, ExpressionIsParenthesized) {
    EXPECT_EQ(generate_escape_code("$a ?: 'none'", OutputContext::URL), "rawurlencode((string)($a ?: 'none'))");
}

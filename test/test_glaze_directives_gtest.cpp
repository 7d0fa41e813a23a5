#include <gtest/gtest.h>
#include "../glaze/compiler.hpp"
#include "../glaze/directive/builtin.hpp"
#include "../glaze/directive/registry.hpp"
#include "../glaze/str_util.hpp"
#include <string.h>
#include <string>

using namespace glaze;

static const char* BODY_START = "extract((array)$__data, EXTR_SKIP);\n        ?>";
static const char* BODY_END = "<?php\n        return ob_get_clean();";

static const std::string ATTR_HELPER = "Sugar\\Core\\Runtime\\HtmlAttributeHelper";
static const std::string EMPTY_HELPER = "Sugar\\Core\\Runtime\\EmptyHelper";

static std::string body_of(const std::string& code) {
    size_t start = code.find(BODY_START);
    size_t end = code.rfind(BODY_END);
    if (start == std::string::npos || end == std::string::npos) return "<no body>";
    start += strlen(BODY_START);
    return code.substr(start, end - start);
}

static std::string compile_body(Compiler& compiler, const std::string& source) {
    CompileResult result = compiler.compile(source);
    EXPECT_TRUE(result.ok) << result.error.message;
    return body_of(result.code);
}

static std::string compile_body(const std::string& source) {
    Compiler compiler;
    return compile_body(compiler, source);
}

static CompileError compile_error(const std::string& source) {
    Compiler compiler;
    CompileResult result = compiler.compile(source);
    EXPECT_FALSE(result.ok);
    return result.error;
}

static std::string html(const std::string& expr) {
    return "<?php echo htmlspecialchars((string)(" + expr + "), ENT_QUOTES | ENT_HTML5, 'UTF-8'); ?>";
}

static std::string spread(const std::string& expr) {
    return "<?php $__attr = " + expr + "; if ($__attr !== '') { echo ' ' . $__attr; } ?>";
}

static const std::string JSON_ATTR_ECHO =
    "echo htmlspecialchars(json_encode($cfg, JSON_HEX_TAG | JSON_HEX_AMP | JSON_HEX_APOS | JSON_HEX_QUOT), "
    "ENT_QUOTES | ENT_HTML5, 'UTF-8');";
static const std::string URL_ECHO = "echo rawurlencode((string)($u));";

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// ============================================================================
// Attribute directives
// ============================================================================

TEST(GlazeAttributeDirectives, Class) {
    EXPECT_EQ(compile_body("<div s:class=\"$c\">x</div>"),
              "<div class=\"<?php echo " + ATTR_HELPER + "::classNames($c); ?>\">x</div>");
}

TEST(GlazeAttributeDirectives, ClassMergesWithStaticClass) {
    EXPECT_EQ(compile_body("<div class=\"btn\" s:class=\"['on' => $on]\">x</div>"),
              "<div class=\"<?php echo " + ATTR_HELPER + "::classNames(['btn', " + ATTR_HELPER +
              "::classNames(['on' => $on])]); ?>\">x</div>");
}

TEST(GlazeAttributeDirectives, SpreadExcludesNamedAttributes) {
    EXPECT_EQ(compile_body("<div id=\"a\" s:spread=\"$attrs\"></div>"),
              "<div id=\"a\"" + spread(ATTR_HELPER + "::spreadAttrs(array_diff_key((array) ($attrs), "
              "['id' => true]))") + "></div>");
}

TEST(GlazeAttributeDirectives, ClassMergesWhenDirectiveComesFirst) {
    EXPECT_EQ(compile_body("<input s:class=\"$c\" class=\"b\">"),
              "<input class=\"<?php echo " + ATTR_HELPER + "::classNames(['b', " + ATTR_HELPER +
              "::classNames($c)]); ?>\" />");
}

TEST(GlazeAttributeDirectives, SpreadExcludesLaterNamedAttributes) {
    EXPECT_EQ(compile_body("<div s:spread=\"$attrs\" id=\"i\"></div>"),
              "<div" + spread(ATTR_HELPER + "::spreadAttrs(array_diff_key((array) ($attrs), "
              "['id' => true]))") + " id=\"i\"></div>");
}

TEST(GlazeAttributeDirectives, SpreadWithoutNamedAttributes) {
    EXPECT_EQ(compile_body("<div s:attr=\"$attrs\"></div>"),
              "<div" + spread(ATTR_HELPER + "::spreadAttrs($attrs)") + "></div>");
}

TEST(GlazeAttributeDirectives, BooleanAttributes) {
    EXPECT_EQ(compile_body("<input type=\"checkbox\" s:checked=\"$on\">"),
              "<input type=\"checkbox\"" + spread(ATTR_HELPER + "::booleanAttribute('checked', $on)") + " />");
    EXPECT_TRUE(contains(compile_body("<option s:selected=\"$s\">a</option>"),
                         "booleanAttribute('selected', $s)"));
    EXPECT_TRUE(contains(compile_body("<button s:disabled=\"$busy\">a</button>"),
                         "booleanAttribute('disabled', $busy)"));
}

TEST(GlazeAttributeDirectives, DynamicTag) {
    std::string var = "$__tag_" + short_hash("$level1_1");
    EXPECT_EQ(compile_body("<h1 s:tag=\"$level\">T</h1>"),
              "<?php " + var + " = Sugar\\Core\\Runtime\\HtmlTagHelper::validateTagName($level); ?>"
              "<<?= " + var + " ?>>T</<?= " + var + " ?>>");
}

TEST(GlazeAttributeDirectives, DynamicTagUnderControlFlow) {
    std::string body = compile_body("<h1 s:if=\"$show\" s:tag=\"$level\">T</h1>");
    EXPECT_TRUE(str_starts_with(body, "<?php if ($show): ?><?php $__tag_"));
    EXPECT_TRUE(str_ends_with(body, " ?>><?php endif; ?>"));
}

TEST(GlazeAttributeDirectives, DynamicTagKeepsOutputContexts) {
    std::string body = compile_body(
        "<h1 s:tag=\"$level\" data-cfg=\"<?= $cfg |> json() ?>\" href=\"<?= $u |> url() ?>\">T</h1>");
    EXPECT_TRUE(contains(body, " data-cfg=\"<?php " + JSON_ATTR_ECHO + " ?>\""));
    EXPECT_TRUE(contains(body, " href=\"<?php " + URL_ECHO + " ?>\""));
}

// ============================================================================
// Content directives
// ============================================================================

TEST(GlazeContentDirectives, TextReplacesBody) {
    EXPECT_EQ(compile_body("<p s:text=\"$m\">placeholder</p>"), "<p>" + html("$m") + "</p>");
}

TEST(GlazeContentDirectives, HtmlIsUnescaped) {
    EXPECT_EQ(compile_body("<div s:html=\"$h\">x</div>"), "<div><?php echo $h; ?></div>");
}

TEST(GlazeContentDirectives, TextWithPipes) {
    EXPECT_EQ(compile_body("<p s:text=\"$m |> upper(...)\"></p>"), "<p>" + html("upper($m)") + "</p>");
    EXPECT_EQ(compile_body("<p s:text=\"$d |> json()\"></p>"),
              "<p><?php echo json_encode($d, JSON_HEX_TAG | JSON_HEX_AMP); ?></p>");
    EXPECT_EQ(compile_body("<p s:text=\"$h |> raw()\"></p>"), "<p><?php echo $h; ?></p>");
}

TEST(GlazeContentDirectives, NowrapDropsElement) {
    EXPECT_EQ(compile_body("<p s:text=\"$m\" s:nowrap>x</p>"), html("$m"));
    EXPECT_EQ(compile_body("<p s:if=\"$a\" s:html=\"$h\" s:nowrap>x</p>"),
              "<?php if ($a): ?><?php echo $h; ?><?php endif; ?>");
}

TEST(GlazeContentDirectives, FragmentContent) {
    EXPECT_EQ(compile_body("<s-template s:text=\"$m\">x</s-template>"), html("$m"));
}

// ============================================================================
// Conditionals
// ============================================================================

TEST(GlazeConditionals, Unless) {
    EXPECT_EQ(compile_body("<p s:unless=\"$x\">a</p>"), "<?php if (!($x)): ?><p>a</p><?php endif; ?>");
}

TEST(GlazeConditionals, IssetEmptyNotempty) {
    EXPECT_EQ(compile_body("<p s:isset=\"$x\">a</p>"), "<?php if (isset($x)): ?><p>a</p><?php endif; ?>");
    EXPECT_EQ(compile_body("<p s:empty=\"$x\">a</p>"),
              "<?php if (" + EMPTY_HELPER + "::isEmpty($x)): ?><p>a</p><?php endif; ?>");
    EXPECT_EQ(compile_body("<p s:notempty=\"$x\">a</p>"),
              "<?php if (!" + EMPTY_HELPER + "::isEmpty($x)): ?><p>a</p><?php endif; ?>");
}

TEST(GlazeConditionals, FragmentCondition) {
    EXPECT_EQ(compile_body("<s-template s:if=\"$a\"><b>x</b></s-template>"),
              "<?php if ($a): ?><b>x</b><?php endif; ?>");
}

TEST(GlazeConditionals, ChainMixesFragmentsAndElements) {
    EXPECT_EQ(compile_body("<s-template s:if=\"$a\">A</s-template><p s:elseif=\"$b\">B</p>"
                           "<s-template s:else><b>C</b></s-template>"),
              "<?php if ($a): ?>A<?php elseif ($b): ?><p>B</p><?php else: ?><b>C</b><?php endif; ?>");
    EXPECT_EQ(compile_body("<p s:if=\"$a\">A</p><s-template s:elseif=\"$b\">B</s-template><p s:else>C</p>"),
              "<?php if ($a): ?><p>A</p><?php elseif ($b): ?>B<?php else: ?><p>C</p><?php endif; ?>");
}

TEST(GlazeConditionals, FinallyWithoutTry) {
    CompileError error = compile_error("<p s:finally>x</p>");
    EXPECT_EQ(error.code, ERR_MISPLACED_DIRECTIVE);
    EXPECT_EQ(error.message, "s:finally must directly follow s:try");
}

TEST(GlazeConditionals, IfContentGuard) {
    std::string body = compile_body("<ul s:ifcontent class=\"list\"><?= $items ?></ul>");
    std::string var = "$__content_" + short_hash("true1_1");
    EXPECT_TRUE(str_starts_with(body, "<?php ob_start(); ?>" + html("$items")));
    EXPECT_TRUE(contains(body, "<?php " + var + " = ob_get_clean();\nif (trim(" + var + ") !== ''): ?>"));
    EXPECT_TRUE(contains(body, "<?php echo '<ul'; ?><?php echo ' class=\"list\"'; ?><?php echo '>'; ?>"));
    EXPECT_TRUE(contains(body, "<?php echo " + var + "; ?><?php echo '</ul>'; ?>"));
    EXPECT_TRUE(str_ends_with(body, "<?php endif; ?>"));
}

TEST(GlazeConditionals, IfContentKeepsOutputContexts) {
    std::string body = compile_body(
        "<div data-cfg=\"<?= $cfg |> json() ?>\" href=\"<?= $u |> url() ?>\" title=\"<?= $h |> raw() ?>\" "
        "class=\"<?= $t ?>\" s:ifcontent>x</div>");
    EXPECT_TRUE(contains(body, "<?php echo ' data-cfg=\"'; ?><?php " + JSON_ATTR_ECHO + " ?>"));
    EXPECT_TRUE(contains(body, "<?php echo ' href=\"'; ?><?php " + URL_ECHO + " ?>"));
    EXPECT_TRUE(contains(body, "<?php echo ' title=\"'; ?><?php echo $h; ?>"));
    EXPECT_TRUE(contains(body, "<?php echo ' class=\"'; ?>" + html("$t")));
}

TEST(GlazeConditionals, IfContentOnFragment) {
    std::string body = compile_body("<s-template s:ifcontent><?= $x ?></s-template>");
    EXPECT_TRUE(str_starts_with(body, "<?php ob_start(); ?>"));
    EXPECT_TRUE(contains(body, "<?php echo $__content_"));
    EXPECT_FALSE(contains(body, "echo '<"));
}

// ============================================================================
// Switch
// ============================================================================

TEST(GlazeSwitch, CasesAndDefault) {
    std::string body = compile_body(
        "<div s:switch=\"$r\"><p s:case=\"'a'\">A</p><p s:default>D</p></div>");
    EXPECT_EQ(body, "<?php switch ($r): ?><?php case 'a': ?><p>A</p><?php break; ?>"
                    "<?php default: ?><p>D</p><?php endswitch; ?>");
}

TEST(GlazeSwitch, CaseNeedsValue) {
    CompileError error = compile_error("<div s:switch=\"$r\"><p s:case=\"\">A</p></div>");
    EXPECT_EQ(error.code, ERR_INVALID_DIRECTIVE_EXPRESSION);
    EXPECT_EQ(error.message, "Case directive requires a value expression");
}

TEST(GlazeSwitch, SingleDefault) {
    CompileError error = compile_error("<div s:switch=\"$r\"><p s:default>A</p><p s:default>B</p></div>");
    EXPECT_EQ(error.code, ERR_DIRECTIVE_CONFLICT);
    EXPECT_EQ(error.message, "Switch directive can only have one default case");
    EXPECT_EQ(error.location.column, 38u);
}

TEST(GlazeSwitch, NeedsAnArm) {
    CompileError error = compile_error("<div s:switch=\"$r\"><p>x</p></div>");
    EXPECT_EQ(error.code, ERR_SYNTAX_ERROR);
    EXPECT_EQ(error.message, "Switch directive must contain at least one case or default");
}

TEST(GlazeSwitch, CaseOutsideSwitch) {
    CompileError error = compile_error("<p s:case=\"1\">x</p>");
    EXPECT_EQ(error.code, ERR_MISPLACED_DIRECTIVE);
    EXPECT_EQ(error.message, "s:case must be placed inside s:switch");
}

// ============================================================================
// Loops
// ============================================================================

TEST(GlazeLoops, ForelseWithEmptyBranch) {
    std::string body = compile_body("<li s:forelse=\"$items as $i\">x</li><li s:empty>none</li>");
    EXPECT_TRUE(str_starts_with(body, "<?php if (!" + EMPTY_HELPER + "::isEmpty($items)): ?>"));
    EXPECT_TRUE(contains(body, "<?php foreach ($items as $i): ?><li>x</li><?php $loop->next(); ?>"));
    EXPECT_TRUE(str_ends_with(body, "<?php $loop = array_pop($__loopStack); ?>"
                                    "<?php else: ?><li>none</li><?php endif; ?>"));
}

TEST(GlazeLoops, ForelseWithoutEmptyIsForeach) {
    std::string body = compile_body("<li s:forelse=\"$items as $i\">x</li>");
    EXPECT_TRUE(str_starts_with(body, "<?php $__loopStack ??= []; ?>"));
    EXPECT_FALSE(contains(body, "isEmpty"));
}

TEST(GlazeLoops, ForeachNeedsAsClause) {
    CompileError error = compile_error("<li s:foreach=\"$items\">x</li>");
    EXPECT_EQ(error.code, ERR_INVALID_DIRECTIVE_EXPRESSION);
    EXPECT_EQ(error.message, "s:foreach requires an expression like \"$items as $item\".");
}

TEST(GlazeLoops, While) {
    EXPECT_EQ(compile_body("<p s:while=\"$more\">x</p>"), "<?php while ($more): ?><p>x</p><?php endwhile; ?>");
    EXPECT_EQ(compile_body("<ul s:while=\"$more\"><li>x</li></ul>"),
              "<ul><?php while ($more): ?><li>x</li><?php endwhile; ?></ul>");
}

TEST(GlazeLoops, TimesWithGeneratedIndex) {
    std::string index = "$__times_" + short_hash("31_1");
    EXPECT_EQ(compile_body("<i s:times=\"3\">*</i>"),
              "<?php for (" + index + " = 0; " + index + " < (3); " + index + "++): ?><i>*</i><?php endfor; ?>");
}

TEST(GlazeLoops, GeneratedNamesKeepPositionsApart) {
    NodeStore store;
    NodeId first = store.make_directive("times", "3", 1, 12);
    NodeId second = store.make_directive("times", "3", 11, 2);
    EXPECT_NE(unique_variable("times", "3", store, first), unique_variable("times", "3", store, second));
    EXPECT_EQ(unique_variable("times", "3", store, first), "$__times_" + short_hash("31_12"));
}

TEST(GlazeLoops, TimesWithIndex) {
    EXPECT_EQ(compile_body("<i s:times=\"$n as $k\">*</i>"),
              "<?php for ($k = 0; $k < ($n); $k++): ?><i>*</i><?php endfor; ?>");
}

TEST(GlazeLoops, TimesErrors) {
    CompileError error = compile_error("<i s:times=\"\">*</i>");
    EXPECT_EQ(error.code, ERR_INVALID_DIRECTIVE_EXPRESSION);
    EXPECT_EQ(error.message, "s:times requires a count expression.");

    error = compile_error("<i s:times=\"3 as k\">*</i>");
    EXPECT_EQ(error.code, ERR_INVALID_DIRECTIVE_EXPRESSION);
    EXPECT_EQ(error.message, "s:times index must be a valid variable name.");
}

// ============================================================================
// Try
// ============================================================================

TEST(GlazeTry, SwallowsFailures) {
    EXPECT_EQ(compile_body("<div s:try>x</div>"),
              "<?php try { ?><div>x</div><?php } catch (\\Throwable $__e) { ?><?php return null; ?><?php } ?>");
}

TEST(GlazeTry, Finally) {
    EXPECT_EQ(compile_body("<div s:try>x</div><p s:finally>y</p>"),
              "<?php try { ?><div>x</div><?php } finally { ?><p>y</p><?php } ?>");
}

// ============================================================================
// Custom directives
// ============================================================================

static bool compile_auth(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    const Node& n = ctx.store.get(node);
    out->push_back(ctx.store.make_raw_code("if ($user !== null):", n.line, n.column));
    out->insert(out->end(), n.children.begin(), n.children.end());
    out->push_back(ctx.store.make_raw_code("endif;", n.line, n.column));
    return true;
}

TEST(GlazeCustomDirectives, RegisteredDirectiveCompiles) {
    Compiler compiler;
    DirectiveDef def;
    def.name = "auth";
    def.type = DirectiveType::CONTROL_FLOW;
    def.compile = compile_auth;
    compiler.registry().define(def);

    EXPECT_EQ(compile_body(compiler, "<nav s:auth>m</nav>"),
              "<?php if ($user !== null): ?><nav>m</nav><?php endif; ?>");
}

TEST(GlazeCustomDirectives, RemovedDirectiveIsUnknown) {
    Compiler compiler;
    ASSERT_TRUE(compiler.registry().remove("while"));
    CompileResult result = compiler.compile("<p s:while=\"$x\">a</p>");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.code, ERR_UNKNOWN_DIRECTIVE);
}

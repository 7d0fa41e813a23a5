#include "code_generator.hpp"
#include "escaper.hpp"
#include "../parser/pipe_parser.hpp"
#include "../pipeline/context.hpp"
#include "../str_util.hpp"
#include "../../lib/log.h"

#include <time.h>

namespace glaze {

std::string html_attribute_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&':  out += "&amp;"; break;
        case '<':  out += "&lt;"; break;
        case '>':  out += "&gt;"; break;
        case '"':  out += "&quot;"; break;
        case '\'': out += "&#039;"; break;
        default:   out += c; break;
        }
    }
    return out;
}

void CodeGenerator::writeln(const char* line) {
    strbuf_append_str(buf_, line);
    strbuf_append_char(buf_, '\n');
}

CodeGenerator::CodeGenerator(CompilationContext& ctx) : ctx_(ctx), buf_(strbuf_new_cap(4096)) {}

CodeGenerator::~CodeGenerator() {
    strbuf_free(buf_);
}

bool CodeGenerator::generate(NodeId document, std::string* out) {
    strbuf_reset(buf_);
    write_preamble();
    bool ok = generate_children(ctx_.store.get(document).children);
    if (ok) {
        write_epilogue();
        out->assign(buf_->str, buf_->length);
        log_debug("glaze codegen: %zu bytes for %s", buf_->length,
                  ctx_.template_path.empty() ? "inline template" : ctx_.template_path.c_str());
    }
    return ok;
}

// ============================================================================
// File frame
// ============================================================================

void CodeGenerator::write_preamble() {
    writeln("<?php");
    writeln("declare(strict_types=1);");
    writeln("// phpcs:ignoreFile");
    writeln("");
    writeln("/**");
    writeln(" * Compiled Sugar template");
    writeln(" *");
    writeln(" * @link https://github.com/josbeir/sugar");
    if (ctx_.debug && !ctx_.template_path.empty()) {
        char stamp[32];
        time_t now = time(NULL);
        struct tm tm_now;
        localtime_r(&now, &tm_now);
        strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_now);
        strbuf_append_format(buf_, " * Source: %s\n", ctx_.template_path.c_str());
        strbuf_append_format(buf_, " * Compiled: %s\n", stamp);
        writeln(" * Debug mode: enabled");
    } else {
        writeln(" * DO NOT EDIT - auto-generated");
    }
    writeln(" */");
    writeln("use Sugar\\Core\\Runtime\\RuntimeEnvironment as __SugarRuntimeEnvironment;");
    writeln("use Sugar\\Core\\Runtime\\TemplateRenderer as __SugarTemplateRenderer;");
    writeln("use Sugar\\Core\\Escape\\Escaper as __SugarEscaper;");
    writeln("");
    writeln("");
    writeln("return function(array|object $__data = []): string {");
    writeln("    ob_start();");
    writeln("    try {");
    writeln("        extract((array)$__data, EXTR_SKIP);");
    strbuf_append_str(buf_, "        ?>");
}

void CodeGenerator::write_epilogue() {
    writeln("<?php");
    writeln("        return ob_get_clean();");
    writeln("    } catch (\\Throwable $__e) {");
    writeln("        ob_end_clean();");
    writeln("        throw $__e;");
    writeln("    }");
    writeln("};");
}

// ============================================================================
// Nodes
// ============================================================================

bool CodeGenerator::generate_children(const std::vector<NodeId>& children) {
    for (NodeId child : children) {
        if (!generate_node(child)) return false;
    }
    return true;
}

bool CodeGenerator::generate_node(NodeId id) {
    const Node& node = ctx_.store.get(id);
    switch (node.type) {
    case NodeType::TEXT:
        generate_text(node);
        return true;
    case NodeType::RAW_BODY:
        strbuf_append_format(buf_, "<?php echo %s; ?>", php_quote(node.text).c_str());
        return true;
    case NodeType::OUTPUT:
        generate_output(node);
        return true;
    case NodeType::RAW_CODE:
        strbuf_append_format(buf_, "<?php %s ?>", str_trim(node.text).c_str());
        return true;
    case NodeType::ELEMENT:
        return generate_element(node);
    case NodeType::DOCUMENT:
    case NodeType::FRAGMENT:
        return generate_children(node.children);
    case NodeType::DIRECTIVE:
    case NodeType::COMPONENT:
        break;
    }
    return ctx_.fail_at(ERR_UNSUPPORTED_NODE,
        std::string("Unsupported node type: ") + node_type_name(node.type), id);
}

// literal text containing a code opener must not reach PHP as markup
void CodeGenerator::generate_text(const Node& node) {
    if (node.text.find("<?") != std::string::npos) {
        strbuf_append_format(buf_, "<?php echo %s; ?>", php_quote(node.text).c_str());
        return;
    }
    strbuf_append_str_n(buf_, node.text.data(), node.text.size());
}

void CodeGenerator::generate_output(const Node& node) {
    std::string expression = compile_pipes(node.expression, node.pipes);
    if (node.escape) expression = generate_escape_code(expression, node.context);
    strbuf_append_format(buf_, "<?php echo %s; ?>", expression.c_str());
}

bool CodeGenerator::generate_element(const Node& node) {
    if (!node.dynamic_tag.empty()) {
        strbuf_append_format(buf_, "<<?= %s ?>", node.dynamic_tag.c_str());
    } else {
        strbuf_append_char(buf_, '<');
        strbuf_append_str(buf_, node.tag.c_str());
    }

    for (const AttributeNode& attr : node.attributes) generate_attribute(attr);
    if (strbuf_ends_with_char(buf_, ' ')) strbuf_rtrim(buf_);

    if (node.self_closing) {
        strbuf_append_str(buf_, " />");
        return true;
    }
    strbuf_append_char(buf_, '>');
    if (!generate_children(node.children)) return false;

    if (!node.dynamic_tag.empty()) {
        strbuf_append_format(buf_, "</<?= %s ?>>", node.dynamic_tag.c_str());
    } else {
        strbuf_append_format(buf_, "</%s>", node.tag.c_str());
    }
    return true;
}

void CodeGenerator::generate_attribute(const AttributeNode& attr) {
    const NodeStore& store = ctx_.store;

    // spread output: emits its own leading space, nothing when empty
    if (attr.name.empty()) {
        if (!attr.value.is_output()) return;
        const Node& output = store.get(attr.value.output());
        std::string expression = compile_pipes(output.expression, output.pipes);
        if (output.escape) expression = generate_escape_code(expression, output.context);
        strbuf_append_format(buf_,
            "<?php $__attr = %s; if ($__attr !== '') { echo ' ' . $__attr; } ?>", expression.c_str());
        return;
    }

    strbuf_append_char(buf_, ' ');
    strbuf_append_str(buf_, attr.name.c_str());
    if (attr.value.is_boolean()) return;

    strbuf_append_str(buf_, "=\"");
    std::vector<AttributePart> parts;
    attr.value.to_parts(&parts);
    if (parts.size() > 1) {
        for (const AttributePart& part : parts) {
            if (part.is_output) generate_output(store.get(part.output));
            else strbuf_append_str_n(buf_, part.text.data(), part.text.size());
        }
    } else if (parts.size() == 1 && parts[0].is_output) {
        generate_output(store.get(parts[0].output));
    } else if (parts.size() == 1) {
        std::string escaped = html_attribute_escape(parts[0].text);
        strbuf_append_str_n(buf_, escaped.data(), escaped.size());
    }
    strbuf_append_char(buf_, '"');
}

} // namespace glaze

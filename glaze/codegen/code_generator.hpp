/**
 * @file code_generator.hpp
 * @brief Document -> PHP closure source
 *
 * The generated file returns a closure that buffers its output:
 *
 *   <?php
 *   declare(strict_types=1);
 *   ...
 *   return function(array|object $__data = []): string {
 *       ob_start();
 *       try {
 *           extract((array)$__data, EXTR_SKIP);
 *           ?>BODY<?php
 *           return ob_get_clean();
 *       } ...
 *   };
 *
 * The body is markup with embedded code blocks. Every OUTPUT is escaped
 * inline for the context chosen by context analysis, so the runtime never
 * inspects values to pick an escaper. Directives and components must be
 * gone by the time the generator runs.
 */

#ifndef GLAZE_CODE_GENERATOR_HPP
#define GLAZE_CODE_GENERATOR_HPP

#include <string>

#include "../ast/node.hpp"
#include "../../lib/strbuf.h"

namespace glaze {

struct CompilationContext;

class CodeGenerator {
public:
    explicit CodeGenerator(CompilationContext& ctx);
    ~CodeGenerator();
    CodeGenerator(const CodeGenerator&) = delete;
    CodeGenerator& operator=(const CodeGenerator&) = delete;

    // false after recording ERR_UNSUPPORTED_NODE on the context; the
    // buffer is reused, so one generator may run several times
    bool generate(NodeId document, std::string* out);

private:
    void write_preamble();
    void write_epilogue();

    bool generate_node(NodeId id);
    bool generate_children(const std::vector<NodeId>& children);
    void generate_text(const Node& node);
    void generate_output(const Node& node);
    bool generate_element(const Node& node);
    void generate_attribute(const AttributeNode& attr);

    void writeln(const char* line);

    CompilationContext& ctx_;
    StrBuf* buf_ = nullptr;
};

// htmlspecialchars($s, ENT_QUOTES) equivalent for literal attribute values
std::string html_attribute_escape(const std::string& text);

} // namespace glaze

#endif // GLAZE_CODE_GENERATOR_HPP

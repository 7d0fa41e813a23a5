/**
 * @file parser.hpp
 * @brief Recursive-descent parser: token stream -> Document
 *
 * One token of lookahead, no backtracking. Open elements form an implicit
 * stack through recursion; a closing tag that matches an outer element
 * closes everything in between, and a closing tag that matches nothing is
 * skipped. Unexpected tokens are skipped as well, so the parser never fails
 * on malformed markup. The only failure is nesting deeper than
 * Config::max_depth.
 */

#ifndef GLAZE_PARSER_HPP
#define GLAZE_PARSER_HPP

#include <string>
#include <vector>

#include "token.hpp"
#include "../ast/node.hpp"
#include "../config.hpp"

namespace glaze {

struct CompilationContext;

class Parser {
public:
    explicit Parser(const Config& config) : config_(config) {}

    // builds the tree in ctx.store; NO_NODE when ctx records an error
    NodeId parse(TokenStream& tokens, CompilationContext& ctx);

private:
    enum class CloseResult { EOF_REACHED, CLOSED, FAILED };

    // `level` is the index of the parent's tag in open_tags_, -1 for the document
    CloseResult parse_children(NodeId parent, uint32_t depth, int level);
    bool parse_tag(NodeId parent, uint32_t depth);
    void parse_closing_tag();
    void parse_attribute(std::vector<AttributeNode>* attributes);
    NodeId parse_output(bool in_attribute);
    NodeId parse_code();

    const Config& config_;
    TokenStream* tokens_ = nullptr;
    CompilationContext* ctx_ = nullptr;
    std::vector<std::string> open_tags_;    // as written, innermost last
    int pending_close_ = -2;                // open_tags_ index matched by a closing tag
};

} // namespace glaze

#endif // GLAZE_PARSER_HPP

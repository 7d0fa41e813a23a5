#include "parser.hpp"
#include "pipe_parser.hpp"
#include "../pipeline/context.hpp"
#include "../str_util.hpp"
#include "../../lib/log.h"

#include <stdio.h>

namespace glaze {

static const int NO_PENDING = -2;

NodeId Parser::parse(TokenStream& tokens, CompilationContext& ctx) {
    tokens_ = &tokens;
    ctx_ = &ctx;
    open_tags_.clear();
    pending_close_ = NO_PENDING;

    NodeId document = ctx.store.make_document();
    CloseResult result = parse_children(document, 0, -1);

    tokens_ = nullptr;
    ctx_ = nullptr;
    if (result == CloseResult::FAILED) return NO_NODE;

    log_debug("glaze parser: %zu top-level nodes, %zu nodes in store",
        ctx.store.get(document).children.size(), ctx.store.size());
    return document;
}

// ============================================================================
// Content
// ============================================================================

Parser::CloseResult Parser::parse_children(NodeId parent, uint32_t depth, int level) {
    NodeStore& store = ctx_->store;

    while (!tokens_->is_eof()) {
        const Token& tok = tokens_->current();
        switch (tok.type) {
        case TokenType::TEXT:
        case TokenType::SPECIAL_TAG:
            store.append_child(parent, store.make_text(tok.lexeme, tok.line, tok.column));
            tokens_->consume();
            break;

        case TokenType::COMMENT:
            if (config_.keep_comments) {
                store.append_child(parent, store.make_text(tok.lexeme, tok.line, tok.column));
            }
            tokens_->consume();
            break;

        case TokenType::RAW_BODY:
            store.append_child(parent, store.make_raw_body(tok.lexeme, tok.line, tok.column));
            tokens_->consume();
            break;

        case TokenType::OUTPUT_OPEN: {
            NodeId output = parse_output(false);
            if (output != NO_NODE) store.append_child(parent, output);
            break;
        }

        case TokenType::CODE_OPEN: {
            NodeId code = parse_code();
            if (code != NO_NODE) store.append_child(parent, code);
            break;
        }

        case TokenType::TAG_OPEN:
            if (tokens_->peek().is(TokenType::SLASH)) {
                parse_closing_tag();
            } else if (!parse_tag(parent, depth)) {
                return CloseResult::FAILED;
            }
            if (pending_close_ != NO_PENDING) {
                if (pending_close_ == level) {
                    pending_close_ = NO_PENDING;
                    return CloseResult::CLOSED;
                }
                if (pending_close_ < level) return CloseResult::CLOSED;
                // matched nothing open at or below this level
                pending_close_ = NO_PENDING;
            }
            break;

        default:
            // stray token outside any construct
            tokens_->consume();
            break;
        }
    }
    return CloseResult::EOF_REACHED;
}

// ============================================================================
// Tags
// ============================================================================

bool Parser::parse_tag(NodeId parent, uint32_t depth) {
    NodeStore& store = ctx_->store;
    const Token& open = tokens_->consume();
    uint32_t line = open.line, column = open.column;

    const Token* name_tok = tokens_->consume_if(TokenType::TAG_NAME);
    if (!name_tok) {
        store.append_child(parent, store.make_text("<", line, column));
        return true;
    }
    std::string name = name_tok->lexeme;

    std::vector<AttributeNode> attributes;
    while (tokens_->at(TokenType::ATTRIBUTE_NAME)) {
        parse_attribute(&attributes);
    }

    bool closed = false, self_close = false;
    if (const Token* close = tokens_->consume_if(TokenType::TAG_CLOSE)) {
        closed = true;
        self_close = close->lexeme == "/>";
    }

    NodeId node;
    if (config_.is_fragment(name)) {
        node = store.make_fragment(line, column);
    } else if (config_.has_element_prefix(name)) {
        node = store.make_component(config_.strip_element_prefix(name), line, column);
    } else {
        node = store.make_element(name, line, column);
    }
    store.get(node).attributes = std::move(attributes);
    store.get(node).self_closing = self_close;
    store.append_child(parent, node);

    if (self_close || !closed) return true;

    if (depth + 1 > config_.max_depth) {
        char message[128];
        snprintf(message, sizeof(message),
            "Template nesting exceeds the maximum depth of %u", config_.max_depth);
        return ctx_->fail(ERR_NESTING_TOO_DEEP, message, line, column);
    }

    open_tags_.push_back(name);
    CloseResult result = parse_children(node, depth + 1, (int)open_tags_.size() - 1);
    open_tags_.pop_back();
    return result != CloseResult::FAILED;
}

void Parser::parse_closing_tag() {
    tokens_->consume();     // <
    tokens_->consume();     // /
    std::string name;
    if (const Token* name_tok = tokens_->consume_if(TokenType::TAG_NAME)) name = name_tok->lexeme;
    tokens_->consume_if(TokenType::TAG_CLOSE);

    if (name.empty()) return;
    for (int i = (int)open_tags_.size() - 1; i >= 0; i--) {
        if (str_iequals(open_tags_[i], name)) {
            pending_close_ = i;
            return;
        }
    }
    log_debug("glaze parser: skipping unmatched closing tag </%s>", name.c_str());
}

// ============================================================================
// Attributes
// ============================================================================

void Parser::parse_attribute(std::vector<AttributeNode>* attributes) {
    const Token& name_tok = tokens_->consume();
    AttributeNode attr;
    attr.name = name_tok.lexeme;
    attr.line = name_tok.line;
    attr.column = name_tok.column;

    if (!tokens_->consume_if(TokenType::EQUALS)) {
        attr.value = AttributeValue::boolean();
        attributes->push_back(std::move(attr));
        return;
    }

    if (tokens_->at(TokenType::OUTPUT_OPEN)) {
        NodeId output = parse_output(true);
        attr.value = output != NO_NODE ? AttributeValue::of_output(output) : AttributeValue::of_static("");
    } else if (tokens_->consume_if(TokenType::QUOTE_OPEN)) {
        std::vector<AttributePart> parts;
        while (true) {
            if (const Token* text = tokens_->consume_if(TokenType::ATTRIBUTE_TEXT)) {
                parts.push_back(AttributePart::literal(text->lexeme));
            } else if (tokens_->at(TokenType::OUTPUT_OPEN)) {
                NodeId output = parse_output(true);
                if (output != NO_NODE) parts.push_back(AttributePart::dynamic(output));
            } else {
                tokens_->consume_if(TokenType::QUOTE_CLOSE);
                break;
            }
        }
        attr.value = AttributeValue::of_parts(std::move(parts));
    } else if (const Token* value = tokens_->consume_if(TokenType::ATTRIBUTE_VALUE_UNQUOTED)) {
        attr.value = AttributeValue::of_static(value->lexeme);
    } else {
        attr.value = AttributeValue::of_static("");
    }
    attributes->push_back(std::move(attr));
}

// ============================================================================
// Output and code
// ============================================================================

NodeId Parser::parse_output(bool in_attribute) {
    const Token& open = tokens_->consume();
    std::string expression;
    if (const Token* expr = tokens_->consume_if(TokenType::EXPRESSION)) expression = expr->lexeme;
    tokens_->consume_if(TokenType::CLOSE);

    expression = str_trim(expression);
    while (!expression.empty() && expression.back() == ';') {
        expression.pop_back();
        expression = str_rtrim(expression);
    }
    if (expression.empty()) return NO_NODE;

    PipeChain chain = parse_pipes(expression);
    OutputContext context = in_attribute ? OutputContext::HTML_ATTRIBUTE : OutputContext::HTML;
    bool context_explicit = false;
    if (chain.raw) {
        context = OutputContext::RAW;
        context_explicit = true;
    } else if (chain.json) {
        context = in_attribute ? OutputContext::JSON_ATTRIBUTE : OutputContext::JSON;
        context_explicit = true;
    } else if (chain.url) {
        context = OutputContext::URL;
        context_explicit = true;
    }

    NodeStore& store = ctx_->store;
    NodeId id = store.make_output(chain.expression, !chain.raw, context, open.line, open.column);
    Node& node = store.get(id);
    node.pipes = std::move(chain.pipes);
    node.context_explicit = context_explicit;
    return id;
}

NodeId Parser::parse_code() {
    const Token& open = tokens_->consume();
    std::string code;
    if (const Token* body = tokens_->consume_if(TokenType::CODE)) code = body->lexeme;
    tokens_->consume_if(TokenType::CLOSE);
    if (str_is_blank(code)) return NO_NODE;
    return ctx_->store.make_raw_code(code, open.line, open.column);
}

} // namespace glaze

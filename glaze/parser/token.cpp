#include "token.hpp"

namespace glaze {

const char* token_type_name(TokenType type) {
    switch (type) {
    case TokenType::TEXT:                       return "Text";
    case TokenType::TAG_OPEN:                   return "TagOpen";
    case TokenType::TAG_NAME:                   return "TagName";
    case TokenType::SLASH:                      return "Slash";
    case TokenType::ATTRIBUTE_NAME:             return "AttributeName";
    case TokenType::EQUALS:                     return "Equals";
    case TokenType::QUOTE_OPEN:                 return "QuoteOpen";
    case TokenType::ATTRIBUTE_TEXT:             return "AttributeText";
    case TokenType::QUOTE_CLOSE:                return "QuoteClose";
    case TokenType::ATTRIBUTE_VALUE_UNQUOTED:   return "AttributeValueUnquoted";
    case TokenType::TAG_CLOSE:                  return "TagClose";
    case TokenType::OUTPUT_OPEN:                return "OutputOpen";
    case TokenType::EXPRESSION:                 return "Expression";
    case TokenType::CODE_OPEN:                  return "CodeOpen";
    case TokenType::CODE:                       return "Code";
    case TokenType::CLOSE:                      return "Close";
    case TokenType::RAW_BODY:                   return "RawBody";
    case TokenType::COMMENT:                    return "Comment";
    case TokenType::SPECIAL_TAG:                return "SpecialTag";
    case TokenType::END_OF_INPUT:               return "Eof";
    }
    return "Unknown";
}

TokenStream::TokenStream(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || !tokens_.back().is(TokenType::END_OF_INPUT)) {
        uint32_t line = tokens_.empty() ? 1 : tokens_.back().line;
        tokens_.emplace_back(TokenType::END_OF_INPUT, "", line, 1);
    }
}

const Token& TokenStream::peek() const {
    size_t next = cursor_ + 1;
    return next < tokens_.size() ? tokens_[next] : tokens_.back();
}

const Token& TokenStream::consume() {
    const Token& token = tokens_[cursor_];
    if (cursor_ + 1 < tokens_.size()) cursor_++;
    return token;
}

const Token* TokenStream::consume_if(TokenType t) {
    if (!current().is(t)) return nullptr;
    return &consume();
}

} // namespace glaze

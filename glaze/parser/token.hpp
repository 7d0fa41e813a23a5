// token.hpp - lexer tokens and the forward-only token cursor

#ifndef GLAZE_TOKEN_HPP
#define GLAZE_TOKEN_HPP

#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

namespace glaze {

enum class TokenType : uint8_t {
    TEXT,
    TAG_OPEN,               // <
    TAG_NAME,
    SLASH,                  // / of a closing tag
    ATTRIBUTE_NAME,
    EQUALS,
    QUOTE_OPEN,
    ATTRIBUTE_TEXT,
    QUOTE_CLOSE,
    ATTRIBUTE_VALUE_UNQUOTED,
    TAG_CLOSE,              // > or />
    OUTPUT_OPEN,            // <?=
    EXPRESSION,
    CODE_OPEN,              // <?php or <?
    CODE,
    CLOSE,                  // ?>
    RAW_BODY,
    COMMENT,
    SPECIAL_TAG,            // <!DOCTYPE ...>, <![CDATA[ ... ]]>
    END_OF_INPUT,
};

const char* token_type_name(TokenType type);

struct Token {
    TokenType type = TokenType::END_OF_INPUT;
    std::string lexeme;
    uint32_t line = 1;
    uint32_t column = 1;

    Token() = default;
    Token(TokenType t, std::string text, uint32_t ln, uint32_t col)
        : type(t), lexeme(std::move(text)), line(ln), column(col) {}

    bool is(TokenType t) const { return type == t; }
};

// Read-only cursor over a token vector that always ends in END_OF_INPUT.
// consume() never moves past the final token.
class TokenStream {
public:
    explicit TokenStream(std::vector<Token> tokens);

    const Token& current() const { return tokens_[cursor_]; }
    const Token& peek() const;
    const Token& consume();
    // consumes and returns the current token when it has type `t`, else nullptr
    const Token* consume_if(TokenType t);
    bool is_eof() const { return current().is(TokenType::END_OF_INPUT); }
    bool at(TokenType t) const { return current().is(t); }
    size_t size() const { return tokens_.size(); }

private:
    std::vector<Token> tokens_;
    size_t cursor_ = 0;
};

} // namespace glaze

#endif // GLAZE_TOKEN_HPP

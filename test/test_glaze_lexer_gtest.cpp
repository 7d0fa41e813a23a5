#include <gtest/gtest.h>
#include "../glaze/parser/lexer.hpp"
#include <string>
#include <vector>

using namespace glaze;

static std::vector<Token> lex(const std::string& source, const Config& config = Config()) {
    Lexer lexer(config);
    return lexer.tokenize(source);
}

static std::vector<TokenType> types_of(const std::vector<Token>& tokens) {
    std::vector<TokenType> types;
    for (const Token& tok : tokens) types.push_back(tok.type);
    return types;
}

TEST(GlazeLexer, EmptySourceEndsWithEof) {
    std::vector<Token> tokens = lex("");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, TokenType::END_OF_INPUT);
}

TEST(GlazeLexer, ElementWithQuotedAttribute) {
    std::vector<Token> tokens = lex("<div class=\"a\">Hi</div>");
    std::vector<TokenType> expected = {
        TokenType::TAG_OPEN, TokenType::TAG_NAME, TokenType::ATTRIBUTE_NAME, TokenType::EQUALS,
        TokenType::QUOTE_OPEN, TokenType::ATTRIBUTE_TEXT, TokenType::QUOTE_CLOSE, TokenType::TAG_CLOSE,
        TokenType::TEXT,
        TokenType::TAG_OPEN, TokenType::SLASH, TokenType::TAG_NAME, TokenType::TAG_CLOSE,
        TokenType::END_OF_INPUT,
    };
    EXPECT_EQ(types_of(tokens), expected);
    EXPECT_EQ(tokens[1].lexeme, "div");
    EXPECT_EQ(tokens[2].lexeme, "class");
    EXPECT_EQ(tokens[5].lexeme, "a");
    EXPECT_EQ(tokens[8].lexeme, "Hi");
}

TEST(GlazeLexer, AttributeColumnIsNameStart) {
    std::vector<Token> tokens = lex("<div s:forech=\"x\">");
    ASSERT_EQ(tokens[2].type, TokenType::ATTRIBUTE_NAME);
    EXPECT_EQ(tokens[2].lexeme, "s:forech");
    EXPECT_EQ(tokens[2].line, 1u);
    EXPECT_EQ(tokens[2].column, 6u);
}

TEST(GlazeLexer, BooleanAndUnquotedAttributes) {
    std::vector<Token> tokens = lex("<input disabled width=10>");
    EXPECT_EQ(tokens[2].type, TokenType::ATTRIBUTE_NAME);
    EXPECT_EQ(tokens[2].lexeme, "disabled");
    EXPECT_EQ(tokens[3].type, TokenType::ATTRIBUTE_NAME);
    EXPECT_EQ(tokens[3].lexeme, "width");
    EXPECT_EQ(tokens[4].type, TokenType::EQUALS);
    EXPECT_EQ(tokens[5].type, TokenType::ATTRIBUTE_VALUE_UNQUOTED);
    EXPECT_EQ(tokens[5].lexeme, "10");
}

TEST(GlazeLexer, VoidElementClosesItself) {
    std::vector<Token> tokens = lex("<br>");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[2].type, TokenType::TAG_CLOSE);
    EXPECT_EQ(tokens[2].lexeme, "/>");

    tokens = lex("<div>");
    EXPECT_EQ(tokens[2].lexeme, ">");
}

TEST(GlazeLexer, OutputInsideQuotedAttribute) {
    std::vector<Token> tokens = lex("<a href=\"/x/<?= $id ?>\">");
    std::vector<TokenType> expected = {
        TokenType::TAG_OPEN, TokenType::TAG_NAME, TokenType::ATTRIBUTE_NAME, TokenType::EQUALS,
        TokenType::QUOTE_OPEN, TokenType::ATTRIBUTE_TEXT,
        TokenType::OUTPUT_OPEN, TokenType::EXPRESSION, TokenType::CLOSE,
        TokenType::QUOTE_CLOSE, TokenType::TAG_CLOSE, TokenType::END_OF_INPUT,
    };
    EXPECT_EQ(types_of(tokens), expected);
    EXPECT_EQ(tokens[5].lexeme, "/x/");
    EXPECT_EQ(tokens[7].lexeme, "$id");
}

TEST(GlazeLexer, OutputExpressionIsTrimmed) {
    std::vector<Token> tokens = lex("a<?=   $x + 1   ?>b");
    std::vector<TokenType> expected = {
        TokenType::TEXT, TokenType::OUTPUT_OPEN, TokenType::EXPRESSION, TokenType::CLOSE,
        TokenType::TEXT, TokenType::END_OF_INPUT,
    };
    EXPECT_EQ(types_of(tokens), expected);
    EXPECT_EQ(tokens[2].lexeme, "$x + 1");
}

TEST(GlazeLexer, CodeBlocks) {
    std::vector<Token> tokens = lex("<?php $a = 1; ?>");
    EXPECT_EQ(tokens[0].type, TokenType::CODE_OPEN);
    EXPECT_EQ(tokens[0].lexeme, "<?php");
    EXPECT_EQ(tokens[1].type, TokenType::CODE);
    EXPECT_EQ(tokens[1].lexeme, "$a = 1;");
    EXPECT_EQ(tokens[2].type, TokenType::CLOSE);

    tokens = lex("<? $b ?>");
    EXPECT_EQ(tokens[0].lexeme, "<?");
    EXPECT_EQ(tokens[1].lexeme, "$b");
}

TEST(GlazeLexer, PhpOpenNeedsWordBoundary) {
    std::vector<Token> tokens = lex("<?phpx ?>");
    EXPECT_EQ(tokens[0].type, TokenType::CODE_OPEN);
    EXPECT_EQ(tokens[0].lexeme, "<?");
    EXPECT_EQ(tokens[1].lexeme, "phpx");
}

TEST(GlazeLexer, CommentsAndSpecialTags) {
    std::vector<Token> tokens = lex("<!DOCTYPE html><!-- note -->");
    EXPECT_EQ(tokens[0].type, TokenType::SPECIAL_TAG);
    EXPECT_EQ(tokens[0].lexeme, "<!DOCTYPE html>");
    EXPECT_EQ(tokens[1].type, TokenType::COMMENT);
    EXPECT_EQ(tokens[1].lexeme, "<!-- note -->");
}

TEST(GlazeLexer, LessThanWithoutTagIsText) {
    std::vector<Token> tokens = lex("a < b");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, TokenType::TEXT);
    EXPECT_EQ(tokens[0].lexeme, "a < b");
}

TEST(GlazeLexer, LineAndColumnTracking) {
    std::vector<Token> tokens = lex("<div>\n  <?= $x ?>");
    const Token* open = nullptr;
    for (const Token& tok : tokens) {
        if (tok.type == TokenType::OUTPUT_OPEN) open = &tok;
    }
    ASSERT_NE(open, nullptr);
    EXPECT_EQ(open->line, 2u);
    EXPECT_EQ(open->column, 3u);
}

TEST(GlazeLexer, RawRegionBodyIsOpaque) {
    std::vector<Token> tokens = lex("<pre s:raw><?= $x ?><b></pre>");
    std::vector<TokenType> expected = {
        TokenType::TAG_OPEN, TokenType::TAG_NAME, TokenType::TAG_CLOSE,
        TokenType::RAW_BODY,
        TokenType::TAG_OPEN, TokenType::SLASH, TokenType::TAG_NAME, TokenType::TAG_CLOSE,
        TokenType::END_OF_INPUT,
    };
    EXPECT_EQ(types_of(tokens), expected);
    EXPECT_EQ(tokens[1].lexeme, "pre");
    EXPECT_EQ(tokens[3].lexeme, "<?= $x ?><b>");
}

TEST(GlazeLexer, RawRegionQuotedGreaterThan) {
    std::vector<Token> tokens = lex("<div data-x=\"a>b\" s:raw><?= $x ?></div>");
    std::vector<TokenType> expected = {
        TokenType::TAG_OPEN, TokenType::TAG_NAME, TokenType::ATTRIBUTE_NAME, TokenType::EQUALS,
        TokenType::QUOTE_OPEN, TokenType::ATTRIBUTE_TEXT, TokenType::QUOTE_CLOSE, TokenType::TAG_CLOSE,
        TokenType::RAW_BODY,
        TokenType::TAG_OPEN, TokenType::SLASH, TokenType::TAG_NAME, TokenType::TAG_CLOSE,
        TokenType::END_OF_INPUT,
    };
    EXPECT_EQ(types_of(tokens), expected);
    EXPECT_EQ(tokens[2].lexeme, "data-x");
    EXPECT_EQ(tokens[5].lexeme, "a>b");
    EXPECT_EQ(tokens[8].lexeme, "<?= $x ?>");
}

TEST(GlazeLexer, RawRegionEscapedQuoteInOpeningTag) {
    std::vector<Token> tokens = lex("<div title=\"a\\\"b\" s:raw><?= $x ?></div>");
    ASSERT_EQ(tokens.size(), 14u);
    EXPECT_EQ(tokens[2].lexeme, "title");
    EXPECT_EQ(tokens[5].type, TokenType::ATTRIBUTE_TEXT);
    EXPECT_EQ(tokens[5].lexeme, "a\\\"b");
    EXPECT_EQ(tokens[8].type, TokenType::RAW_BODY);
    EXPECT_EQ(tokens[8].lexeme, "<?= $x ?>");
    for (const Token& tok : tokens) EXPECT_NE(tok.lexeme, "s:raw");
}

TEST(GlazeLexer, RawRegionNestedSameTag) {
    std::vector<Token> tokens = lex("<div s:raw><div><div>a</div></div><?= $x ?></div><p>");
    ASSERT_GE(tokens.size(), 4u);
    EXPECT_EQ(tokens[3].type, TokenType::RAW_BODY);
    EXPECT_EQ(tokens[3].lexeme, "<div><div>a</div></div><?= $x ?>");

    // the outer close ends the region and lexing resumes after it
    std::vector<TokenType> types = types_of(tokens);
    std::vector<TokenType> tail(types.end() - 4, types.end());
    std::vector<TokenType> expected = {
        TokenType::TAG_OPEN, TokenType::TAG_NAME, TokenType::TAG_CLOSE, TokenType::END_OF_INPUT,
    };
    EXPECT_EQ(tail, expected);
    EXPECT_EQ(tokens[tokens.size() - 3].lexeme, "p");
}

TEST(GlazeLexer, RawRegionWithoutCloseIsOrdinary) {
    std::vector<Token> tokens = lex("<div s:raw><div>a</div>");
    for (const Token& tok : tokens) EXPECT_NE(tok.type, TokenType::RAW_BODY);
}

TEST(GlazeLexer, RawRegionFollowsPrefix) {
    std::vector<Token> tokens = lex("<pre x:raw><?= $x ?></pre>", Config::with_prefix("x"));
    EXPECT_EQ(tokens[3].type, TokenType::RAW_BODY);

    // s:raw is an ordinary attribute under another prefix
    tokens = lex("<pre s:raw><?= $x ?></pre>", Config::with_prefix("x"));
    EXPECT_EQ(tokens[2].type, TokenType::ATTRIBUTE_NAME);
    EXPECT_EQ(tokens[2].lexeme, "s:raw");
}

TEST(GlazeLexer, UnterminatedInputNeverFails) {
    std::vector<Token> tokens = lex("<div class=\"abc");
    EXPECT_EQ(tokens.back().type, TokenType::END_OF_INPUT);
    tokens = lex("<?= $x");
    EXPECT_EQ(tokens.back().type, TokenType::END_OF_INPUT);
    EXPECT_EQ(tokens[1].type, TokenType::EXPRESSION);
    EXPECT_EQ(tokens[1].lexeme, "$x");
}

TEST(GlazeLexer, TokenizeIsReentrant) {
    Lexer lexer((Config()));
    std::vector<Token> first = lexer.tokenize("<p>a</p>");
    std::vector<Token> second = lexer.tokenize("<p>a</p>");
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); i++) {
        EXPECT_EQ(first[i].type, second[i].type);
        EXPECT_EQ(first[i].lexeme, second[i].lexeme);
    }
}

TEST(GlazeLexer, TokenStreamStopsAtEof) {
    TokenStream stream(lex("x"));
    EXPECT_EQ(stream.current().type, TokenType::TEXT);
    EXPECT_EQ(stream.peek().type, TokenType::END_OF_INPUT);
    stream.consume();
    EXPECT_TRUE(stream.is_eof());
    stream.consume();
    EXPECT_TRUE(stream.is_eof());
    EXPECT_EQ(stream.consume_if(TokenType::TEXT), nullptr);
}

TEST(GlazeLexer, TokenTypeNames) {
    EXPECT_STREQ(token_type_name(TokenType::TAG_OPEN), "TagOpen");
    EXPECT_STREQ(token_type_name(TokenType::END_OF_INPUT), "Eof");
}

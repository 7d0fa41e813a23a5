#include "lexer.hpp"
#include "../re2_patterns.hpp"
#include "../str_util.hpp"
#include "../../lib/log.h"

#include <ctype.h>
#include <string.h>

#include <re2/re2.h>

namespace glaze {

static inline bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

static inline bool is_name_char(char c, bool attribute) {
    return isalnum((unsigned char)c) || c == '-' || c == '_' || c == ':' || c == '.' ||
           (attribute && c == '@');
}

Lexer::Lexer(const Config& config)
    : config_(config), raw_attribute_(config.build_name("raw")) {
    raw_pattern_ = compile_raw_attribute_pattern(raw_attribute_);
}

Lexer::~Lexer() = default;

std::vector<Token> Lexer::tokenize(const std::string& source) {
    source_ = &source;
    length_ = source.size();
    pos_ = 0;
    line_ = 1;
    column_ = 1;
    tokens_.clear();
    raw_regions_.clear();
    next_raw_ = 0;
    line_index_.reset();

    scan_raw_regions();
    scan_text_state();

    emit(TokenType::END_OF_INPUT, "", line_, column_);
    log_debug("glaze lexer: %zu bytes -> %zu tokens (%zu raw regions)",
        length_, tokens_.size(), raw_regions_.size());

    std::vector<Token> out;
    out.swap(tokens_);
    source_ = nullptr;
    line_index_.reset();
    return out;
}

// ============================================================================
// Text state
// ============================================================================

void Lexer::scan_text_state() {
    while (pos_ < length_) {
        const RawRegion* region = raw_region_at(pos_);
        if (region) {
            RawRegion copy = *region;
            emit_raw_region(copy);
            continue;
        }
        if (looking_at("<?=")) {
            scan_output();
            continue;
        }
        if (looking_at("<?php") && !is_alnum_at(pos_ + 5)) {
            scan_code();
            continue;
        }
        if (looking_at("<?")) {
            scan_code();
            continue;
        }
        if (looking_at("<!--")) {
            scan_comment();
            continue;
        }
        if (looking_at("<!")) {
            scan_special_tag();
            continue;
        }
        if (char_at(pos_) == '<' && is_tag_start()) {
            scan_tag();
            continue;
        }
        scan_text();
    }
}

void Lexer::scan_text() {
    uint32_t start_line = line_, start_col = column_;
    size_t start = pos_;

    while (pos_ < length_) {
        if (raw_region_at(pos_)) break;
        if (looking_at("<?")) break;
        if (char_at(pos_) == '<' && (is_tag_start() || looking_at("<!"))) break;
        advance();
    }

    if (pos_ > start) {
        emit(TokenType::TEXT, source_->substr(start, pos_ - start), start_line, start_col);
    }
}

// ============================================================================
// Tag state
// ============================================================================

void Lexer::scan_tag() {
    uint32_t open_line = line_, open_col = column_;

    emit(TokenType::TAG_OPEN, "<", line_, column_);
    advance();

    bool closing = false;
    if (char_at(pos_) == '/') {
        closing = true;
        emit(TokenType::SLASH, "/", line_, column_);
        advance();
    }

    std::string tag_name = read_name(false);
    if (!tag_name.empty()) {
        emit(TokenType::TAG_NAME, tag_name, open_line, open_col + (closing ? 2 : 1));
    }

    if (closing) {
        skip_whitespace();
        if (char_at(pos_) == '>' && pos_ < length_) {
            emit(TokenType::TAG_CLOSE, ">", line_, column_);
            advance();
        }
        return;
    }

    scan_attributes();

    if (looking_at("/>")) {
        emit(TokenType::TAG_CLOSE, "/>", line_, column_);
        advance();
        advance();
    } else if (pos_ < length_ && char_at(pos_) == '>') {
        // void elements close themselves even without the slash
        bool self_close = !tag_name.empty() && config_.is_self_closing(tag_name);
        emit(TokenType::TAG_CLOSE, self_close ? "/>" : ">", line_, column_);
        advance();
    }
}

void Lexer::scan_attributes() {
    while (pos_ < length_) {
        skip_whitespace();
        if (pos_ >= length_) break;

        char ch = char_at(pos_);
        if (ch == '>' || looking_at("/>")) break;

        std::string name = read_name(true);
        if (name.empty()) {
            advance();  // not an attribute start
            continue;
        }
        emit(TokenType::ATTRIBUTE_NAME, name, line_, column_ - (uint32_t)name.size());

        skip_whitespace();
        if (pos_ < length_ && char_at(pos_) == '=') {
            emit(TokenType::EQUALS, "=", line_, column_);
            advance();
            skip_whitespace();
            if (pos_ < length_) scan_attribute_value();
        }
        // otherwise a boolean attribute
    }
}

void Lexer::scan_attribute_value() {
    if (looking_at("<?=")) {
        scan_output();
        return;
    }
    char ch = char_at(pos_);
    if (ch == '"' || ch == '\'') {
        scan_quoted_value(ch);
        return;
    }
    scan_unquoted_value();
}

void Lexer::scan_quoted_value(char quote) {
    emit(TokenType::QUOTE_OPEN, std::string(1, quote), line_, column_);
    advance();

    size_t text_start = pos_;
    uint32_t text_line = line_, text_col = column_;

    auto flush_text = [&]() {
        if (pos_ > text_start) {
            emit(TokenType::ATTRIBUTE_TEXT, source_->substr(text_start, pos_ - text_start),
                text_line, text_col);
        }
    };

    while (pos_ < length_) {
        char ch = char_at(pos_);
        if (ch == quote) {
            flush_text();
            emit(TokenType::QUOTE_CLOSE, std::string(1, quote), line_, column_);
            advance();
            return;
        }
        if (looking_at("<?=")) {
            flush_text();
            scan_output();
            text_start = pos_;
            text_line = line_;
            text_col = column_;
            continue;
        }
        if (ch == '\\' && pos_ + 1 < length_ && char_at(pos_ + 1) == quote) {
            advance();
            advance();
            continue;
        }
        advance();
    }

    // unterminated quote
    flush_text();
}

void Lexer::scan_unquoted_value() {
    size_t start = pos_;
    uint32_t start_line = line_, start_col = column_;
    while (pos_ < length_) {
        char ch = char_at(pos_);
        if (is_ws(ch) || ch == '>' || looking_at("/>")) break;
        advance();
    }
    if (pos_ > start) {
        emit(TokenType::ATTRIBUTE_VALUE_UNQUOTED, source_->substr(start, pos_ - start),
            start_line, start_col);
    }
}

// ============================================================================
// Output and code
// ============================================================================

void Lexer::scan_output() {
    emit(TokenType::OUTPUT_OPEN, "<?=", line_, column_);
    advance();
    advance();
    advance();

    skip_whitespace();
    size_t start = pos_;
    uint32_t expr_line = line_, expr_col = column_;
    while (pos_ < length_ && !looking_at("?>")) advance();

    std::string expr = str_rtrim(source_->substr(start, pos_ - start));
    if (!expr.empty()) emit(TokenType::EXPRESSION, expr, expr_line, expr_col);

    if (looking_at("?>")) {
        emit(TokenType::CLOSE, "?>", line_, column_);
        advance();
        advance();
    }
}

void Lexer::scan_code() {
    const char* open = looking_at("<?php") && !is_alnum_at(pos_ + 5) ? "<?php" : "<?";
    emit(TokenType::CODE_OPEN, open, line_, column_);
    for (size_t i = 0, n = strlen(open); i < n; i++) advance();

    skip_whitespace();
    size_t start = pos_;
    uint32_t code_line = line_, code_col = column_;
    while (pos_ < length_ && !looking_at("?>")) advance();

    std::string code = str_rtrim(source_->substr(start, pos_ - start));
    if (!code.empty()) emit(TokenType::CODE, code, code_line, code_col);

    if (looking_at("?>")) {
        emit(TokenType::CLOSE, "?>", line_, column_);
        advance();
        advance();
    }
}

// ============================================================================
// Comments and special tags
// ============================================================================

void Lexer::scan_comment() {
    size_t start = pos_;
    uint32_t start_line = line_, start_col = column_;
    advance_to(pos_ + 4);
    while (pos_ < length_) {
        if (looking_at("-->")) {
            advance_to(pos_ + 3);
            break;
        }
        advance();
    }
    emit(TokenType::COMMENT, source_->substr(start, pos_ - start), start_line, start_col);
}

void Lexer::scan_special_tag() {
    size_t start = pos_;
    uint32_t start_line = line_, start_col = column_;
    if (looking_at("<![CDATA[")) {
        while (pos_ < length_) {
            if (looking_at("]]>")) {
                advance_to(pos_ + 3);
                break;
            }
            advance();
        }
    } else {
        while (pos_ < length_) {
            if (char_at(pos_) == '>') {
                advance();
                break;
            }
            advance();
        }
    }
    emit(TokenType::SPECIAL_TAG, source_->substr(start, pos_ - start), start_line, start_col);
}

// ============================================================================
// Raw regions
// ============================================================================

void Lexer::scan_raw_regions() {
    if (source_->find(raw_attribute_) == std::string::npos) return;

    size_t offset = 0;
    RawRegion region;
    while (find_next_raw_region(offset, &region)) {
        raw_regions_.push_back(region);
        offset = region.close_end;
    }
    if (!raw_regions_.empty()) {
        line_index_ = LineIndexCache::shared().get(*source_);
    }
}

bool Lexer::find_next_raw_region(size_t offset, RawRegion* region) {
    size_t tag_start;
    while ((tag_start = source_->find('<', offset)) != std::string::npos) {
        SimpleTag tag;
        if (!extract_simple_tag(tag_start, &tag) || tag.is_close) {
            offset = tag_start + 1;
            continue;
        }
        offset = tag.end;
        if (tag.self_closing) continue;

        std::string tag_source = source_->substr(tag.start, tag.end - tag.start);
        if (!raw_pattern_->ok() || !re2::RE2::PartialMatch(tag_source, *raw_pattern_)) continue;

        size_t close_start = find_matching_close(tag.name, tag.end);
        if (close_start == std::string::npos) continue;

        SimpleTag close_tag;
        if (!extract_simple_tag(close_start, &close_tag) || !close_tag.is_close) continue;

        region->open_start = tag.start;
        region->open_end = tag.end;
        region->close_start = close_start;
        region->close_end = close_tag.end;
        region->tag_name = tag.name;
        return true;
    }
    return false;
}

bool Lexer::extract_simple_tag(size_t start, SimpleTag* tag) const {
    if (char_at(start) != '<' || start + 1 >= length_) return false;
    char next = char_at(start + 1);
    if (next == '!' || next == '?') return false;

    bool is_close = next == '/';
    if (!is_close && !isalpha((unsigned char)next)) return false;

    size_t name_start = start + (is_close ? 2 : 1);
    size_t name_end = read_simple_name_end(name_start);
    if (name_end == name_start) return false;

    size_t end = find_simple_tag_end(name_end);
    if (end == std::string::npos) return false;

    tag->is_close = is_close;
    tag->start = start;
    tag->end = end;
    tag->name = source_->substr(name_start, name_end - name_start);
    tag->self_closing = false;
    if (!is_close) {
        std::string raw = str_rtrim(source_->substr(start, end - start));
        tag->self_closing = str_ends_with(raw, "/>") || config_.is_self_closing(tag->name);
    }
    return true;
}

size_t Lexer::read_simple_name_end(size_t pos) const {
    while (pos < length_ && is_name_char((*source_)[pos], false)) pos++;
    return pos;
}

size_t Lexer::find_simple_tag_end(size_t pos) const {
    while (pos < length_) {
        char ch = (*source_)[pos];
        if (ch == '>') return pos + 1;
        if (ch == '"' || ch == '\'') {
            pos++;
            while (pos < length_ && (*source_)[pos] != ch) {
                // \" stays inside the value, as in scan_quoted_value()
                if ((*source_)[pos] == '\\' && pos + 1 < length_ && (*source_)[pos + 1] == ch) pos++;
                pos++;
            }
        }
        pos++;
    }
    return std::string::npos;
}

size_t Lexer::find_matching_close(const std::string& tag_name, size_t offset) const {
    int depth = 1;
    size_t tag_start;
    while ((tag_start = source_->find('<', offset)) != std::string::npos) {
        SimpleTag tag;
        if (!extract_simple_tag(tag_start, &tag)) {
            offset = tag_start + 1;
            continue;
        }
        offset = tag.end;
        if (!str_iequals(tag.name, tag_name)) continue;

        if (tag.is_close) {
            if (--depth == 0) return tag.start;
        } else if (!tag.self_closing) {
            depth++;
        }
    }
    return std::string::npos;
}

const Lexer::RawRegion* Lexer::raw_region_at(size_t pos) {
    while (next_raw_ < raw_regions_.size() && raw_regions_[next_raw_].open_start < pos) {
        next_raw_++;
    }
    if (next_raw_ < raw_regions_.size() && raw_regions_[next_raw_].open_start == pos) {
        return &raw_regions_[next_raw_];
    }
    return nullptr;
}

void Lexer::emit_raw_region(const RawRegion& region) {
    const std::string& src = *source_;

    // opening tag, minus the raw attribute
    emit_at(TokenType::TAG_OPEN, "<", region.open_start);
    size_t name_end = region.open_start + 1;
    while (name_end < region.open_end && !is_ws(src[name_end]) &&
           src[name_end] != '>' && src[name_end] != '/') {
        name_end++;
    }
    std::string tag_name = src.substr(region.open_start + 1, name_end - region.open_start - 1);
    emit_at(TokenType::TAG_NAME, tag_name, region.open_start + 1);

    size_t attr_end = region.open_end;
    while (attr_end > name_end && strchr(" \t\n\r/>", src[attr_end - 1])) attr_end--;
    emit_raw_attributes(name_end, attr_end);

    std::string open_source = str_rtrim(src.substr(region.open_start, region.open_end - region.open_start));
    const char* close = str_ends_with(open_source, "/>") ? "/>" : ">";
    emit_at(TokenType::TAG_CLOSE, close, region.open_end - strlen(close));

    if (region.close_start > region.open_end) {
        emit_at(TokenType::RAW_BODY, src.substr(region.open_end, region.close_start - region.open_end),
            region.open_end);
    }

    // closing tag
    emit_at(TokenType::TAG_OPEN, "<", region.close_start);
    emit_at(TokenType::SLASH, "/", region.close_start + 1);
    emit_at(TokenType::TAG_NAME, region.tag_name, region.close_start + 2);
    emit_at(TokenType::TAG_CLOSE, ">", region.close_start + 2 + region.tag_name.size());

    advance_to(region.close_end);
}

void Lexer::emit_raw_attributes(size_t start, size_t end) {
    const std::string& src = *source_;
    size_t pos = start;

    auto skip_ws = [&]() {
        while (pos < end && is_ws(src[pos])) pos++;
    };

    while (pos < end) {
        skip_ws();
        if (pos >= end) break;

        size_t name_start = pos;
        while (pos < end && !is_ws(src[pos]) && src[pos] != '=' && src[pos] != '>' && src[pos] != '/') {
            pos++;
        }
        std::string name = src.substr(name_start, pos - name_start);
        bool skipped = name.empty() || name == raw_attribute_;
        if (name.empty() && pos < end && (src[pos] == '/' || src[pos] == '>')) pos++;
        if (!skipped) emit_at(TokenType::ATTRIBUTE_NAME, name, name_start);

        skip_ws();
        if (pos >= end || src[pos] != '=') continue;
        if (!skipped) emit_at(TokenType::EQUALS, "=", pos);
        pos++;
        skip_ws();
        if (pos >= end) break;

        char q = src[pos];
        if (q == '"' || q == '\'') {
            size_t quote_pos = pos++;
            size_t value_start = pos;
            while (pos < end && src[pos] != q) {
                if (src[pos] == '\\' && pos + 1 < end && src[pos + 1] == q) {
                    pos += 2;
                    continue;
                }
                pos++;
            }
            if (!skipped) {
                emit_at(TokenType::QUOTE_OPEN, std::string(1, q), quote_pos);
                if (pos > value_start) {
                    emit_at(TokenType::ATTRIBUTE_TEXT, src.substr(value_start, pos - value_start), value_start);
                }
                emit_at(TokenType::QUOTE_CLOSE, std::string(1, q), pos);
            }
            if (pos < end) pos++;
        } else {
            size_t value_start = pos;
            while (pos < end && !is_ws(src[pos])) pos++;
            if (!skipped && pos > value_start) {
                emit_at(TokenType::ATTRIBUTE_VALUE_UNQUOTED, src.substr(value_start, pos - value_start),
                    value_start);
            }
        }
    }
}

void Lexer::emit_at(TokenType type, const std::string& lexeme, size_t offset) {
    uint32_t line = 1, column = 1;
    if (line_index_) line_index_->line_column_at(offset, &line, &column);
    emit(type, lexeme, line, column);
}

// ============================================================================
// Low-level helpers
// ============================================================================

bool Lexer::looking_at(const char* text) const {
    size_t n = strlen(text);
    return pos_ + n <= length_ && source_->compare(pos_, n, text) == 0;
}

bool Lexer::is_tag_start() const {
    if (pos_ + 1 >= length_) return false;
    char next = char_at(pos_ + 1);
    return isalpha((unsigned char)next) || next == '/';
}

bool Lexer::is_alnum_at(size_t pos) const {
    return pos < length_ && isalnum((unsigned char)(*source_)[pos]);
}

std::string Lexer::read_name(bool attribute) {
    size_t start = pos_;
    while (pos_ < length_ && is_name_char(char_at(pos_), attribute)) advance();
    return source_->substr(start, pos_ - start);
}

void Lexer::advance() {
    if (pos_ >= length_) return;
    if ((*source_)[pos_] == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    pos_++;
}

void Lexer::advance_to(size_t target) {
    while (pos_ < target && pos_ < length_) advance();
}

void Lexer::skip_whitespace() {
    while (pos_ < length_ && is_ws((*source_)[pos_])) advance();
}

void Lexer::emit(TokenType type, std::string lexeme, uint32_t line, uint32_t column) {
    tokens_.emplace_back(type, std::move(lexeme), line, column);
}

} // namespace glaze

/**
 * @file lexer.hpp
 * @brief State-machine lexer for glaze templates
 *
 * Scans the source byte by byte and produces a flat token vector that always
 * ends with END_OF_INPUT. The lexer understands both markup structure and
 * code open/close transitions:
 *
 *   text        plain content between tags
 *   tag         <name attr="v" ...> and </name>
 *   attr value  quoted, unquoted or a direct <?= ... ?>
 *   output      <?= expression ?>
 *   code        <?php code ?> and <? code ?>
 *
 * Elements carrying the `<prefix>:raw` attribute are located in a pre-scan
 * and their body is emitted as one RAW_BODY token, never lexed further.
 *
 * Malformed input never fails: unterminated constructs flush whatever was
 * collected so far and validation happens in later stages.
 */

#ifndef GLAZE_LEXER_HPP
#define GLAZE_LEXER_HPP

#include <stddef.h>
#include <memory>
#include <string>
#include <vector>

#include "token.hpp"
#include "line_index.hpp"
#include "../config.hpp"

namespace re2 { class RE2; }

namespace glaze {

class Lexer {
public:
    explicit Lexer(const Config& config);
    ~Lexer();

    // re-entrant: all scanning state is reset on each call
    std::vector<Token> tokenize(const std::string& source);

private:
    struct RawRegion {
        size_t open_start;
        size_t open_end;        // one past '>' of the opening tag
        size_t close_start;     // '<' of the matching closing tag
        size_t close_end;
        std::string tag_name;
    };

    struct SimpleTag {
        bool is_close;
        bool self_closing;
        size_t start;
        size_t end;             // one past '>'
        std::string name;
    };

    // ---- main states ----
    void scan_text_state();
    void scan_text();
    void scan_tag();
    void scan_attributes();
    void scan_attribute_value();
    void scan_quoted_value(char quote);
    void scan_unquoted_value();
    void scan_output();
    void scan_code();
    void scan_comment();
    void scan_special_tag();

    // ---- raw regions ----
    void scan_raw_regions();
    bool find_next_raw_region(size_t offset, RawRegion* region);
    bool extract_simple_tag(size_t start, SimpleTag* tag) const;
    size_t read_simple_name_end(size_t pos) const;
    size_t find_simple_tag_end(size_t pos) const;
    size_t find_matching_close(const std::string& tag_name, size_t offset) const;
    const RawRegion* raw_region_at(size_t pos);
    void emit_raw_region(const RawRegion& region);
    void emit_raw_attributes(size_t start, size_t end);
    void emit_at(TokenType type, const std::string& lexeme, size_t offset);

    // ---- low-level helpers ----
    bool looking_at(const char* text) const;
    char char_at(size_t pos) const { return pos < length_ ? (*source_)[pos] : '\0'; }
    bool is_tag_start() const;
    bool is_alnum_at(size_t pos) const;
    std::string read_name(bool attribute);
    void advance();
    void advance_to(size_t target);
    void skip_whitespace();
    void emit(TokenType type, std::string lexeme, uint32_t line, uint32_t column);

    Config config_;
    std::string raw_attribute_;                 // "<prefix>:raw"
    std::unique_ptr<re2::RE2> raw_pattern_;

    const std::string* source_ = nullptr;
    size_t length_ = 0;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t column_ = 1;
    std::vector<Token> tokens_;
    std::vector<RawRegion> raw_regions_;
    size_t next_raw_ = 0;
    std::shared_ptr<const LineIndex> line_index_;
};

} // namespace glaze

#endif // GLAZE_LEXER_HPP

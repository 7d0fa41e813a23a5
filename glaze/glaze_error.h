/**
 * @file glaze_error.h
 * @brief Glaze compile diagnostics
 *
 * Error codes with source location, snippet and suggestion. The compiler
 * never throws; every stage records the first error on its
 * CompilationContext and returns a failure value to its caller.
 */

#pragma once

#include <stdint.h>
#include <string>
#include <vector>

// ============================================================================
// Error Code Ranges
// ============================================================================

#define GLAZE_ERR_SYNTAX_BASE    100
#define GLAZE_ERR_SEMANTIC_BASE  200
#define GLAZE_ERR_IO_BASE        400
#define GLAZE_ERR_INTERNAL_BASE  500

#define GLAZE_ERR_IS_SYNTAX(code)    ((code) >= 100 && (code) < 200)
#define GLAZE_ERR_IS_SEMANTIC(code)  ((code) >= 200 && (code) < 300)
#define GLAZE_ERR_IS_IO(code)        ((code) >= 400 && (code) < 500)
#define GLAZE_ERR_IS_INTERNAL(code)  ((code) >= 500 && (code) < 600)

namespace glaze {

// ============================================================================
// Error Codes
// ============================================================================

enum GlazeErrorCode {
    GLAZE_OK = 0,

    // 1xx - template syntax (malformed directives)
    ERR_SYNTAX_ERROR = 100,                 // generic syntax error
    ERR_UNKNOWN_DIRECTIVE = 101,            // s:name not registered
    ERR_INVALID_DIRECTIVE_EXPRESSION = 102, // missing `as`, empty case value, ...
    ERR_DYNAMIC_DIRECTIVE_VALUE = 103,      // <?= ?> inside a directive attribute
    ERR_DIRECTIVE_CONFLICT = 104,           // two control-flow directives, duplicate default
    ERR_INVALID_ATTRIBUTE = 105,            // attribute not allowed on fragment/claimed element
    ERR_MISPLACED_DIRECTIVE = 106,          // case outside switch, nowrap without content

    // 2xx - compilation limits
    ERR_NESTING_TOO_DEEP = 201,             // tree depth above Config::max_depth
    ERR_REWRITE_LIMIT = 202,                // restart replay above Config::max_rewrites
    ERR_PIPELINE_RESULT = 203,              // passes did not leave a single document

    // 4xx - I/O (loaders, CLI)
    ERR_FILE_NOT_FOUND = 401,
    ERR_FILE_READ_ERROR = 402,
    ERR_FILE_WRITE_ERROR = 403,

    // 5xx - internal
    ERR_UNSUPPORTED_NODE = 501,             // code generator has no rule for a node
    ERR_INVALID_STATE = 502,
};

// ============================================================================
// Source Location
// ============================================================================

struct SourceLocation {
    std::string file;       // template path, empty for inline sources
    uint32_t line = 0;      // 1-based, 0 when unknown
    uint32_t column = 0;    // 1-based, 0 when unknown
};

// ============================================================================
// Compile Error
// ============================================================================

struct CompileError {
    GlazeErrorCode code = GLAZE_OK;
    std::string message;
    SourceLocation location;
    std::string snippet;        // source excerpt with caret, may be empty
    std::string suggestion;     // did-you-mean candidate, may be empty

    bool ok() const { return code == GLAZE_OK; }
    bool is_syntax() const { return GLAZE_ERR_IS_SYNTAX(code); }
};

const char* err_code_name(GlazeErrorCode code);

// "<message> (template: <path> line:<L> column:<C>)" plus snippet lines
std::string err_format(const CompileError& error);

// excerpt of `source` around line/column, `context_lines` either side
std::string err_snippet(const std::string& source, uint32_t line, uint32_t column,
                        int context_lines = 2);

// ============================================================================
// Suggestions
// ============================================================================

size_t levenshtein(const std::string& a, const std::string& b);

// closest candidate within max(2, len/3) edits, empty when none qualifies
std::string did_you_mean(const std::string& input, const std::vector<std::string>& candidates);

} // namespace glaze

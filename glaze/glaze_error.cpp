#include "glaze_error.h"
#include "str_util.hpp"
#include "parser/line_index.hpp"

#include <stdio.h>
#include <algorithm>

namespace glaze {

const char* err_code_name(GlazeErrorCode code) {
    switch (code) {
    case GLAZE_OK:                          return "OK";
    case ERR_SYNTAX_ERROR:                  return "SYNTAX_ERROR";
    case ERR_UNKNOWN_DIRECTIVE:             return "UNKNOWN_DIRECTIVE";
    case ERR_INVALID_DIRECTIVE_EXPRESSION:  return "INVALID_DIRECTIVE_EXPRESSION";
    case ERR_DYNAMIC_DIRECTIVE_VALUE:       return "DYNAMIC_DIRECTIVE_VALUE";
    case ERR_DIRECTIVE_CONFLICT:            return "DIRECTIVE_CONFLICT";
    case ERR_INVALID_ATTRIBUTE:             return "INVALID_ATTRIBUTE";
    case ERR_MISPLACED_DIRECTIVE:           return "MISPLACED_DIRECTIVE";
    case ERR_NESTING_TOO_DEEP:              return "NESTING_TOO_DEEP";
    case ERR_REWRITE_LIMIT:                 return "REWRITE_LIMIT";
    case ERR_PIPELINE_RESULT:               return "PIPELINE_RESULT";
    case ERR_FILE_NOT_FOUND:                return "FILE_NOT_FOUND";
    case ERR_FILE_READ_ERROR:               return "FILE_READ_ERROR";
    case ERR_FILE_WRITE_ERROR:              return "FILE_WRITE_ERROR";
    case ERR_UNSUPPORTED_NODE:              return "UNSUPPORTED_NODE";
    case ERR_INVALID_STATE:                 return "INVALID_STATE";
    }
    return "UNKNOWN";
}

std::string err_format(const CompileError& error) {
    std::string out = error.message;
    if (!error.location.file.empty()) {
        char pos[64];
        out += " (template: ";
        out += error.location.file;
        if (error.location.line > 0) {
            snprintf(pos, sizeof(pos), " line:%u", error.location.line);
            out += pos;
        }
        if (error.location.column > 0) {
            snprintf(pos, sizeof(pos), " column:%u", error.location.column);
            out += pos;
        }
        out += ")";
    }
    if (!error.snippet.empty()) {
        out += "\n\n";
        out += error.snippet;
    }
    return out;
}

std::string err_snippet(const std::string& source, uint32_t line, uint32_t column,
                        int context_lines) {
    if (line == 0 || str_is_blank(source)) return "";

    std::shared_ptr<const LineIndex> index = LineIndexCache::shared().get(source);
    uint32_t total = (uint32_t)index->line_count();
    if (line > total) return "";

    auto line_text = [&](uint32_t n) {
        size_t start = index->line_start(n);
        return source.substr(start, index->line_end(n) - start);
    };
    if (str_is_blank(line_text(line))) return "";

    uint32_t first = line > (uint32_t)context_lines ? line - (uint32_t)context_lines : 1;
    uint32_t last = std::min(total, line + (uint32_t)context_lines);

    // line-number gutter is at least 2 wide
    int padding = std::max(2, (int)std::to_string(last).size());

    std::string out;
    for (uint32_t n = first; n <= last; n++) {
        char gutter[32];
        snprintf(gutter, sizeof(gutter), "%*u | ", padding, n);
        if (!out.empty()) out += '\n';
        out += gutter;
        out += line_text(n);
        if (n == line && column > 0) {
            out += '\n';
            out.append((size_t)padding + 3 + column - 1, ' ');
            out += '^';
        }
    }
    return out;
}

// ============================================================================
// Suggestions
// ============================================================================

size_t levenshtein(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); j++) prev[j] = j;
    for (size_t i = 1; i <= a.size(); i++) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); j++) {
            size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

std::string did_you_mean(const std::string& input, const std::vector<std::string>& candidates) {
    size_t threshold = std::max<size_t>(2, input.size() / 3);
    size_t best_distance = threshold + 1;
    std::string best;
    for (const std::string& candidate : candidates) {
        size_t d = levenshtein(input, candidate);
        if (d < best_distance) {   // strict: first candidate wins ties
            best_distance = d;
            best = candidate;
        }
    }
    return best;
}

} // namespace glaze

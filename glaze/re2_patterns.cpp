/**
 * @file re2_patterns.cpp
 * @brief Process-wide compiled RE2 patterns
 */

#include "re2_patterns.hpp"
#include "../lib/log.h"

namespace glaze {

static re2::RE2* compile_pattern(const char* source, bool case_insensitive) {
    re2::RE2::Options options;
    options.set_log_errors(false);
    options.set_case_sensitive(!case_insensitive);
    re2::RE2* re = new re2::RE2(source, options);
    if (!re->ok()) {
        log_error("glaze: failed to compile pattern %s: %s", source, re->error().c_str());
    }
    return re;
}

// compiled once, never freed

const re2::RE2& pattern_foreach_clause() {
    static re2::RE2* re = compile_pattern("^.+\\s+as\\s+.+$", true);
    return *re;
}

const re2::RE2& pattern_as_split() {
    static re2::RE2* re = compile_pattern("^(.+?)\\s+as\\s+(.+)$", true);
    return *re;
}

const re2::RE2& pattern_variable_name() {
    static re2::RE2* re = compile_pattern("^\\$[a-zA-Z_]\\w*$", false);
    return *re;
}

const re2::RE2& pattern_named_attribute() {
    static re2::RE2* re = compile_pattern("(?s)^([a-zA-Z][a-zA-Z0-9:_.-]*)=\"(.+)\"$", false);
    return *re;
}

const re2::RE2& pattern_pipe_separator() {
    static re2::RE2* re = compile_pattern("(?s)(.*?)\\s*\\|>\\s*", false);
    return *re;
}

const re2::RE2& pattern_pipe_marker() {
    static re2::RE2* re = compile_pattern("^(raw|json|url)\\s*\\(\\s*\\)$", false);
    return *re;
}

const re2::RE2& pattern_block_name() {
    static re2::RE2* re = compile_pattern("^[a-zA-Z0-9_.:-]+$", false);
    return *re;
}

std::unique_ptr<re2::RE2> compile_raw_attribute_pattern(const std::string& raw_attribute) {
    // RE2 has no lookahead, so the terminator is consumed instead
    std::string source = "(?:\\s|^)" + re2::RE2::QuoteMeta(raw_attribute) +
        "(?:\\s*=\\s*(?:\"[^\"]*\"|'[^']*'|[^\\s>]+))?(?:\\s|/?>)";
    re2::RE2::Options options;
    options.set_log_errors(false);
    std::unique_ptr<re2::RE2> re(new re2::RE2(source, options));
    if (!re->ok()) {
        log_error("glaze: failed to compile raw attribute pattern: %s", re->error().c_str());
    }
    return re;
}

bool pattern_full_match(const re2::RE2& pattern, const std::string& text) {
    return pattern.ok() && re2::RE2::FullMatch(text, pattern);
}

} // namespace glaze

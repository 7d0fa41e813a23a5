/**
 * @file re2_patterns.hpp
 * @brief Shared RE2 patterns used by the lexer, pipe parser and directives
 *
 * Each accessor compiles its pattern on first use and keeps it for the
 * lifetime of the process. RE2 objects are thread-safe for matching.
 */

#pragma once

#include <memory>
#include <string>

#include <re2/re2.h>

namespace glaze {

// "<collection> as <binding>", case-insensitive
const re2::RE2& pattern_foreach_clause();
// captures (left, right) of "<left> as <right>", case-insensitive
const re2::RE2& pattern_as_split();
// "$name" index variable for s:times
const re2::RE2& pattern_variable_name();
// name="value" produced by attribute directives, captures (name, value)
const re2::RE2& pattern_named_attribute();
// text before the next `|>` separator, for RE2::Consume
const re2::RE2& pattern_pipe_separator();
// raw() / json() / url() pipe markers, captures the marker name
const re2::RE2& pattern_pipe_marker();
// bare block name accepted by s:ifblock without quotes
const re2::RE2& pattern_block_name();

// `<prefix>:raw` attribute anywhere inside an opening tag source
std::unique_ptr<re2::RE2> compile_raw_attribute_pattern(const std::string& raw_attribute);

bool pattern_full_match(const re2::RE2& pattern, const std::string& text);

} // namespace glaze

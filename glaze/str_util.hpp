// str_util.hpp - small string helpers shared across the compiler

#ifndef GLAZE_STR_UTIL_HPP
#define GLAZE_STR_UTIL_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

namespace glaze {

std::string str_trim(const std::string& s);
std::string str_rtrim(const std::string& s);
std::string str_ltrim(const std::string& s);
bool str_is_blank(const std::string& s);
bool str_starts_with(const std::string& s, const std::string& prefix);
bool str_ends_with(const std::string& s, const std::string& suffix);
bool str_contains(const std::string& s, const char* needle);
std::string str_to_lower(const std::string& s);
bool str_iequals(const std::string& a, const std::string& b);
std::string str_replace_all(const std::string& s, const std::string& from, const std::string& to);
std::string str_join(const std::vector<std::string>& parts, const char* sep);

// single-quoted PHP literal, same shape as var_export() for strings
std::string php_quote(const std::string& s);

// FNV-1a
uint32_t fnv1a_32(const char* data, size_t len);
uint64_t fnv1a_64(const char* data, size_t len);

// 8 lowercase hex digits of fnv1a_32(text)
std::string short_hash(const std::string& text);

} // namespace glaze

#endif // GLAZE_STR_UTIL_HPP

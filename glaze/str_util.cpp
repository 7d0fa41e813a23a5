#include "str_util.hpp"

#include <ctype.h>
#include <stdio.h>
#include <string.h>

namespace glaze {

static bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\0';
}

std::string str_ltrim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && is_ws(s[start])) start++;
    return s.substr(start);
}

std::string str_rtrim(const std::string& s) {
    size_t end = s.size();
    while (end > 0 && is_ws(s[end - 1])) end--;
    return s.substr(0, end);
}

std::string str_trim(const std::string& s) {
    return str_rtrim(str_ltrim(s));
}

bool str_is_blank(const std::string& s) {
    for (char c : s) {
        if (!is_ws(c)) return false;
    }
    return true;
}

bool str_starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool str_ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool str_contains(const std::string& s, const char* needle) {
    return s.find(needle) != std::string::npos;
}

std::string str_to_lower(const std::string& s) {
    std::string out(s);
    for (char& c : out) c = (char)tolower((unsigned char)c);
    return out;
}

bool str_iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (tolower((unsigned char)a[i]) != tolower((unsigned char)b[i])) return false;
    }
    return true;
}

std::string str_replace_all(const std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t hit = s.find(from, pos);
        if (hit == std::string::npos) break;
        out.append(s, pos, hit - pos);
        out += to;
        pos = hit + from.size();
    }
    out.append(s, pos, std::string::npos);
    return out;
}

std::string str_join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::string php_quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '\'';
    for (char c : s) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

uint32_t fnv1a_32(const char* data, size_t len) {
    uint32_t hash = 2166136261u;
    for (size_t i = 0; i < len; i++) {
        hash ^= (unsigned char)data[i];
        hash *= 16777619u;
    }
    return hash;
}

uint64_t fnv1a_64(const char* data, size_t len) {
    uint64_t hash = 14695981039346656037ull;
    for (size_t i = 0; i < len; i++) {
        hash ^= (unsigned char)data[i];
        hash *= 1099511628211ull;
    }
    return hash;
}

std::string short_hash(const std::string& text) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%08x", fnv1a_32(text.data(), text.size()));
    return std::string(buf);
}

} // namespace glaze

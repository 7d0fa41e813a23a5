#include "strbuf.h"

#include <ctype.h>

#define STRBUF_INITIAL_CAP 64

static size_t round_up_pow2(size_t x) {
    size_t cap = STRBUF_INITIAL_CAP;
    while (cap < x) cap <<= 1;
    return cap;
}

StrBuf* strbuf_new_cap(size_t size) {
    StrBuf* sb = (StrBuf*)calloc(1, sizeof(StrBuf));
    if (!sb) return nullptr;
    if (!strbuf_ensure_cap(sb, size ? size : 1)) {
        free(sb);
        return nullptr;
    }
    return sb;
}

void strbuf_free(StrBuf *sb) {
    if (!sb) return;
    free(sb->str);
    free(sb);
}

void strbuf_reset(StrBuf *sb) {
    sb->length = 0;
    if (sb->str) sb->str[0] = '\0';
}

bool strbuf_ensure_cap(StrBuf *sb, size_t min_capacity) {
    if (sb->str && min_capacity <= sb->capacity) return true;
    size_t new_cap = round_up_pow2(min_capacity);
    char* grown = (char*)realloc(sb->str, new_cap);
    if (!grown) return false;
    if (!sb->str) grown[0] = '\0';
    sb->str = grown;
    sb->capacity = new_cap;
    return true;
}

void strbuf_append_str_n(StrBuf *sb, const char *str, size_t n) {
    if (!str || n == 0) return;
    if (!strbuf_ensure_cap(sb, sb->length + n + 1)) return;
    memcpy(sb->str + sb->length, str, n);
    sb->length += n;
    sb->str[sb->length] = '\0';
}

void strbuf_append_str(StrBuf *sb, const char *str) {
    if (str) strbuf_append_str_n(sb, str, strlen(str));
}

void strbuf_append_char(StrBuf *sb, char c) {
    if (!strbuf_ensure_cap(sb, sb->length + 2)) return;
    sb->str[sb->length++] = c;
    sb->str[sb->length] = '\0';
}

void strbuf_vappend_format(StrBuf *sb, const char *format, va_list args) {
    va_list probe;
    va_copy(probe, args);
    int needed = vsnprintf(nullptr, 0, format, probe);
    va_end(probe);
    if (needed <= 0) return;
    if (!strbuf_ensure_cap(sb, sb->length + (size_t)needed + 1)) return;
    vsnprintf(sb->str + sb->length, (size_t)needed + 1, format, args);
    sb->length += (size_t)needed;
}

void strbuf_append_format(StrBuf *sb, const char *format, ...) {
    va_list args;
    va_start(args, format);
    strbuf_vappend_format(sb, format, args);
    va_end(args);
}

void strbuf_rtrim(StrBuf *sb) {
    while (sb->length > 0 && isspace((unsigned char)sb->str[sb->length - 1])) {
        sb->length--;
    }
    if (sb->str) sb->str[sb->length] = '\0';
}

bool strbuf_ends_with_char(const StrBuf *sb, char c) {
    return sb->length > 0 && sb->str[sb->length - 1] == c;
}

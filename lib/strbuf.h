#ifndef STRING_BUFFER_H
#define STRING_BUFFER_H

#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <stdarg.h>
#include <stdbool.h>

// growable, always NUL-terminated byte buffer
typedef struct {
    char* str;
    size_t length;
    size_t capacity;
} StrBuf;

StrBuf* strbuf_new_cap(size_t size);
void strbuf_free(StrBuf *sb);
void strbuf_reset(StrBuf *sb);
bool strbuf_ensure_cap(StrBuf *sb, size_t min_capacity);
void strbuf_append_str(StrBuf *sb, const char *str);
void strbuf_append_str_n(StrBuf *sb, const char *str, size_t n);
void strbuf_append_char(StrBuf *sb, char c);
void strbuf_append_format(StrBuf *sb, const char *format, ...);
void strbuf_vappend_format(StrBuf *sb, const char *format, va_list args);
// drops trailing ASCII whitespace
void strbuf_rtrim(StrBuf *sb);
bool strbuf_ends_with_char(const StrBuf *sb, char c);

#endif

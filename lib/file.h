#ifndef FILE_H
#define FILE_H

#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// reads the whole file, NUL-terminated; caller frees. NULL on failure.
// `out_len` (optional) receives the byte length.
char* read_text_file(const char *filename, size_t *out_len);

// writes `len` bytes, replacing the file. false on failure.
bool write_text_file(const char *filename, const char *content, size_t len);

bool file_exists(const char *filename);

#ifdef __cplusplus
}
#endif

#endif // FILE_H

#include "file.h"
#include "log.h"

#include <stdio.h>
#include <stdlib.h>
#include <sys/stat.h>

char* read_text_file(const char *filename, size_t *out_len) {
    FILE* file = fopen(filename, "rb");
    if (!file) {
        log_debug("read_text_file: cannot open %s", filename);
        return NULL;
    }

    if (fseek(file, 0, SEEK_END) != 0) {
        fclose(file);
        return NULL;
    }
    long size = ftell(file);
    if (size < 0 || fseek(file, 0, SEEK_SET) != 0) {
        fclose(file);
        return NULL;
    }

    char* buffer = (char*)malloc((size_t)size + 1);
    if (!buffer) {
        log_error("read_text_file: out of memory reading %s", filename);
        fclose(file);
        return NULL;
    }

    size_t read = fread(buffer, 1, (size_t)size, file);
    fclose(file);
    if (read != (size_t)size) {
        log_error("read_text_file: short read on %s", filename);
        free(buffer);
        return NULL;
    }
    buffer[size] = '\0';
    if (out_len) *out_len = (size_t)size;
    return buffer;
}

bool write_text_file(const char *filename, const char *content, size_t len) {
    FILE* file = fopen(filename, "wb");
    if (!file) {
        log_error("write_text_file: cannot open %s", filename);
        return false;
    }
    size_t written = fwrite(content, 1, len, file);
    bool ok = written == len;
    if (fclose(file) != 0) ok = false;
    if (!ok) log_error("write_text_file: failed writing %s", filename);
    return ok;
}

bool file_exists(const char *filename) {
    struct stat st;
    return stat(filename, &st) == 0 && S_ISREG(st.st_mode);
}

// log.cpp - default-category logger behind lib/log.h
//
// Only one category exists ("default"); log_get_category() hands it out for
// any name so callers written against the category API keep working.

#include "log.h"

#include <string.h>
#include <strings.h>
#include <ctype.h>
#include <time.h>
#include <mutex>
#include <string>

namespace {

struct LogSettings {
    int level = LOG_LEVEL_WARN;
    std::string output = "stderr";
    int timestamps = 0;
};

log_category_t g_default = {"default", LOG_LEVEL_WARN, nullptr, 1};
LogSettings g_pending;
int g_timestamps = 0;
bool g_owns_output = false;
std::mutex g_write_lock;

void close_output() {
    if (g_owns_output && g_default.output) {
        fclose(g_default.output);
    }
    g_owns_output = false;
    g_default.output = nullptr;
}

std::string trim(const std::string& s) {
    size_t start = 0, end = s.size();
    while (start < end && isspace((unsigned char)s[start])) start++;
    while (end > start && isspace((unsigned char)s[end - 1])) end--;
    return s.substr(start, end - start);
}

int write_entry(log_category_t* category, int level, const char* format, va_list args) {
    if (!category || !category->enabled || level < category->level) return LOG_OK;
    FILE* out = category->output ? category->output : stderr;

    std::lock_guard<std::mutex> guard(g_write_lock);
    if (g_timestamps) {
        char stamp[32];
        time_t now = time(nullptr);
        struct tm tm_now;
        localtime_r(&now, &tm_now);
        strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_now);
        fprintf(out, "%s ", stamp);
    }
    fprintf(out, "[%s] ", log_level_to_string(level));
    if (vfprintf(out, format, args) < 0) return LOG_WRITE_FAIL;
    fputc('\n', out);
    fflush(out);
    return LOG_OK;
}

}  // namespace

log_category_t *log_default_category = &g_default;

int log_parse_config_string(const char *config) {
    if (!config) return LOG_WRONG_FORMAT;
    LogSettings parsed = g_pending;
    const char* p = config;
    while (*p) {
        const char* eol = strchr(p, '\n');
        std::string line = eol ? std::string(p, eol - p) : std::string(p);
        p = eol ? eol + 1 : p + line.size();

        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) return LOG_WRONG_FORMAT;
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (key == "level") {
            int level = log_level_from_string(value.c_str());
            if (level < 0) return LOG_WRONG_FORMAT;
            parsed.level = level;
        } else if (key == "output") {
            parsed.output = value;
        } else if (key == "timestamps") {
            parsed.timestamps = (value == "1" || value == "true") ? 1 : 0;
        }
        // other keys belong to richer zlog configs; ignored
    }
    g_pending = parsed;
    return LOG_OK;
}

int log_parse_config_file(const char *filename) {
    FILE* file = filename ? fopen(filename, "r") : nullptr;
    if (!file) return LOG_INIT_FAIL;
    std::string text;
    char chunk[512];
    size_t n;
    while ((n = fread(chunk, 1, sizeof(chunk), file)) > 0) {
        text.append(chunk, n);
    }
    fclose(file);
    return log_parse_config_string(text.c_str());
}

int log_init(const char *config) {
    if (config && *config) {
        int rc = log_parse_config_string(config);
        if (rc != LOG_OK) return rc;
    }
    close_output();
    g_default.level = g_pending.level;
    g_default.enabled = 1;
    g_timestamps = g_pending.timestamps;

    if (g_pending.output == "stderr" || g_pending.output.empty()) {
        g_default.output = stderr;
    } else if (g_pending.output == "stdout") {
        g_default.output = stdout;
    } else {
        g_default.output = fopen(g_pending.output.c_str(), "a");
        if (!g_default.output) {
            g_default.output = stderr;
            return LOG_INIT_FAIL;
        }
        g_owns_output = true;
    }
    return LOG_OK;
}

void log_fini(void) {
    close_output();
    g_pending = LogSettings();
    g_default.level = LOG_LEVEL_WARN;
}

log_category_t* log_get_category(const char *cname) {
    (void)cname;
    return &g_default;
}

int log_level_enabled(log_category_t *category, const int level) {
    return category && category->enabled && level >= category->level;
}

void log_set_level(log_category_t *category, int level) {
    if (category) category->level = level;
}

void log_set_output(log_category_t *category, FILE *output) {
    if (!category) return;
    if (category == &g_default) close_output();
    category->output = output;
}

void log_enable_timestamps(int enable) {
    g_timestamps = enable;
}

const char* log_level_to_string(int level) {
    switch (level) {
    case LOG_LEVEL_DEBUG:  return "DEBUG";
    case LOG_LEVEL_INFO:   return "INFO";
    case LOG_LEVEL_NOTICE: return "NOTICE";
    case LOG_LEVEL_WARN:   return "WARN";
    case LOG_LEVEL_ERROR:  return "ERROR";
    case LOG_LEVEL_FATAL:  return "FATAL";
    default:               return "UNKNOWN";
    }
}

int log_level_from_string(const char *name) {
    if (!name) return -1;
    if (strcasecmp(name, "debug") == 0) return LOG_LEVEL_DEBUG;
    if (strcasecmp(name, "info") == 0) return LOG_LEVEL_INFO;
    if (strcasecmp(name, "notice") == 0) return LOG_LEVEL_NOTICE;
    if (strcasecmp(name, "warn") == 0) return LOG_LEVEL_WARN;
    if (strcasecmp(name, "error") == 0) return LOG_LEVEL_ERROR;
    if (strcasecmp(name, "fatal") == 0) return LOG_LEVEL_FATAL;
    return -1;
}

#define GLAZE_LOG_FORWARD(fn, category, lvl)            \
    int fn(const char *format, ...) {                   \
        va_list args;                                   \
        va_start(args, format);                         \
        int rc = write_entry(category, lvl, format, args); \
        va_end(args);                                   \
        return rc;                                      \
    }

GLAZE_LOG_FORWARD(log_fatal, &g_default, LOG_LEVEL_FATAL)
GLAZE_LOG_FORWARD(log_error, &g_default, LOG_LEVEL_ERROR)
GLAZE_LOG_FORWARD(log_warn, &g_default, LOG_LEVEL_WARN)
GLAZE_LOG_FORWARD(log_notice, &g_default, LOG_LEVEL_NOTICE)
GLAZE_LOG_FORWARD(log_info, &g_default, LOG_LEVEL_INFO)
GLAZE_LOG_FORWARD(log_debug, &g_default, LOG_LEVEL_DEBUG)

#define GLAZE_CLOG_FORWARD(fn, lvl)                                  \
    int fn(log_category_t *category, const char *format, ...) {      \
        va_list args;                                                \
        va_start(args, format);                                      \
        int rc = write_entry(category, lvl, format, args);           \
        va_end(args);                                                \
        return rc;                                                   \
    }

GLAZE_CLOG_FORWARD(clog_error, LOG_LEVEL_ERROR)
GLAZE_CLOG_FORWARD(clog_warn, LOG_LEVEL_WARN)
GLAZE_CLOG_FORWARD(clog_info, LOG_LEVEL_INFO)
GLAZE_CLOG_FORWARD(clog_debug, LOG_LEVEL_DEBUG)

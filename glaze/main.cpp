// main.cpp - glaze command line: compile one template to PHP

#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <string>

#include "compiler.hpp"
#include "../lib/file.h"
#include "../lib/log.h"

using namespace glaze;

static void print_help(const char* prog) {
    printf("glaze - Sugar template to PHP compiler\n\n");
    printf("Usage: %s compile <template> [options]\n\n", prog);
    printf("Options:\n");
    printf("  -o, --output <file>    write the compiled PHP to <file> (default: stdout)\n");
    printf("  --prefix <p>           directive prefix (default: s)\n");
    printf("  --fragment <name>      fragment element name (default: <prefix>-template)\n");
    printf("  --runtime-ns <ns>      namespace of the runtime helper classes\n");
    printf("  --debug                add source path and compile time to the header\n");
    printf("  --no-comments          drop HTML comments from the output\n");
    printf("  --deps                 list the templates the compile depended on\n");
    printf("  -h, --help             show this help\n\n");
    printf("Exit status: 0 on success, 1 on compile error, 2 on usage error.\n");
}

static int usage_error(const char* prog, const char* message, const char* arg) {
    if (arg) fprintf(stderr, "Error: %s '%s'\n", message, arg);
    else fprintf(stderr, "Error: %s\n", message);
    fprintf(stderr, "Use '%s --help' for more information\n", prog);
    return 2;
}

static int exec_compile(const char* prog, int argc, char* argv[]) {
    const char* input_file = NULL;
    const char* output_file = NULL;
    const char* prefix = NULL;
    const char* fragment = NULL;
    const char* runtime_ns = NULL;
    bool debug = false;
    bool keep_comments = true;
    bool print_deps = false;

    for (int i = 0; i < argc; i++) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;
        if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
            if (!has_value) return usage_error(prog, "missing value for", arg);
            output_file = argv[++i];
        } else if (strcmp(arg, "--prefix") == 0) {
            if (!has_value) return usage_error(prog, "missing value for", arg);
            prefix = argv[++i];
        } else if (strcmp(arg, "--fragment") == 0) {
            if (!has_value) return usage_error(prog, "missing value for", arg);
            fragment = argv[++i];
        } else if (strcmp(arg, "--runtime-ns") == 0) {
            if (!has_value) return usage_error(prog, "missing value for", arg);
            runtime_ns = argv[++i];
        } else if (strcmp(arg, "--debug") == 0) {
            debug = true;
        } else if (strcmp(arg, "--no-comments") == 0) {
            keep_comments = false;
        } else if (strcmp(arg, "--deps") == 0) {
            print_deps = true;
        } else if (arg[0] != '-' && !input_file) {
            input_file = arg;
        } else {
            return usage_error(prog, "unknown option", arg);
        }
    }
    if (!input_file) return usage_error(prog, "no template given", NULL);
    if (prefix && !*prefix) return usage_error(prog, "empty prefix", NULL);

    Config config = prefix ? Config::with_prefix(prefix) : Config();
    if (fragment) config.fragment_element = fragment;
    if (runtime_ns) config.runtime_namespace = runtime_ns;
    config.keep_comments = keep_comments;

    // the loader is rooted at the template's directory
    std::string path = input_file;
    std::string base_dir = ".";
    size_t slash = path.find_last_of('/');
    if (slash != std::string::npos) {
        base_dir = slash == 0 ? "/" : path.substr(0, slash);
        path = path.substr(slash + 1);
    }

    FileLoader loader(base_dir);
    DependencyList deps;
    Compiler compiler(config);
    CompileResult result = compiler.compile_template(path, loader, &deps, debug);
    if (!result.ok) {
        fprintf(stderr, "%s\n", err_format(result.error).c_str());
        return 1;
    }

    if (output_file) {
        if (!write_text_file(output_file, result.code.data(), result.code.size())) {
            fprintf(stderr, "Error: failed to write '%s'\n", output_file);
            return 1;
        }
        log_info("glaze: wrote %zu bytes to %s", result.code.size(), output_file);
    } else {
        fwrite(result.code.data(), 1, result.code.size(), stdout);
    }

    if (print_deps) {
        FILE* out = output_file ? stdout : stderr;
        for (const std::string& dep : deps.dependencies()) fprintf(out, "dependency: %s\n", dep.c_str());
        for (const std::string& comp : deps.components()) fprintf(out, "component: %s\n", comp.c_str());
    }
    return 0;
}

int main(int argc, char* argv[]) {
    if (access("log.conf", F_OK) == 0) {
        if (log_parse_config_file("log.conf") != LOG_OK) {
            fprintf(stderr, "Warning: Failed to parse log.conf, using defaults\n");
        }
    }
    log_init("");

    int status;
    if (argc < 2) {
        status = usage_error(argv[0], "no command given", NULL);
    } else if (strcmp(argv[1], "--help") == 0 || strcmp(argv[1], "-h") == 0) {
        print_help(argv[0]);
        status = 0;
    } else if (strcmp(argv[1], "compile") == 0) {
        if (argc >= 3 && (strcmp(argv[2], "--help") == 0 || strcmp(argv[2], "-h") == 0)) {
            print_help(argv[0]);
            status = 0;
        } else {
            status = exec_compile(argv[0], argc - 2, argv + 2);
        }
    } else {
        status = usage_error(argv[0], "unknown command", argv[1]);
    }

    log_fini();
    return status;
}

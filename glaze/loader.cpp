#include "loader.hpp"
#include "str_util.hpp"
#include "../lib/file.h"
#include "../lib/log.h"

#include <stdlib.h>
#include <algorithm>

namespace glaze {

std::string resolve_template_path(const std::string& path, const std::string& from_path) {
    std::string joined;
    if (!path.empty() && path[0] == '/') {
        joined = path.substr(1);
    } else {
        size_t slash = from_path.find_last_of('/');
        if (slash != std::string::npos) joined = from_path.substr(0, slash + 1);
        joined += path;
    }

    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= joined.size()) {
        size_t end = joined.find('/', start);
        if (end == std::string::npos) end = joined.size();
        std::string segment = joined.substr(start, end - start);
        if (segment == "..") {
            if (!segments.empty()) segments.pop_back();
        } else if (!segment.empty() && segment != ".") {
            segments.push_back(segment);
        }
        start = end + 1;
    }
    return str_join(segments, "/");
}

// ============================================================================
// MemoryLoader
// ============================================================================

void MemoryLoader::add(const std::string& path, const std::string& source) {
    templates_[resolve_template_path(path, "")] = source;
}

std::string MemoryLoader::resolve(const std::string& path, const std::string& from_path) const {
    return resolve_template_path(path, from_path);
}

bool MemoryLoader::load(const std::string& path, std::string* out_text, CompileError* error) const {
    auto found = templates_.find(path);
    if (found == templates_.end()) {
        error->code = ERR_FILE_NOT_FOUND;
        error->message = "Template \"" + path + "\" not found";
        error->location.file = path;
        return false;
    }
    *out_text = found->second;
    return true;
}

// ============================================================================
// FileLoader
// ============================================================================

FileLoader::FileLoader(const std::string& base_dir) : base_dir_(base_dir) {
    while (base_dir_.size() > 1 && base_dir_.back() == '/') base_dir_.pop_back();
}

std::string FileLoader::resolve(const std::string& path, const std::string& from_path) const {
    return resolve_template_path(path, from_path);
}

bool FileLoader::load(const std::string& path, std::string* out_text, CompileError* error) const {
    std::string full = base_dir_.empty() ? path : base_dir_ + "/" + path;
    if (!file_exists(full.c_str())) {
        error->code = ERR_FILE_NOT_FOUND;
        error->message = "Template \"" + path + "\" not found in " + (base_dir_.empty() ? "." : base_dir_);
        error->location.file = path;
        return false;
    }

    size_t len = 0;
    char* content = read_text_file(full.c_str(), &len);
    if (!content) {
        error->code = ERR_FILE_READ_ERROR;
        error->message = "Failed to read template \"" + full + "\"";
        error->location.file = path;
        return false;
    }
    out_text->assign(content, len);
    free(content);
    log_debug("glaze loader: read %s (%zu bytes)", full.c_str(), len);
    return true;
}

// ============================================================================
// DependencyList
// ============================================================================

static void push_unique(std::vector<std::string>& list, const std::string& path) {
    if (std::find(list.begin(), list.end(), path) == list.end()) list.push_back(path);
}

void DependencyList::add_dependency(const std::string& path) {
    push_unique(dependencies_, path);
}

void DependencyList::add_component(const std::string& path) {
    push_unique(components_, path);
}

} // namespace glaze

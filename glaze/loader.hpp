// loader.hpp - template loading and dependency reporting collaborators

#ifndef GLAZE_LOADER_HPP
#define GLAZE_LOADER_HPP

#include <map>
#include <string>
#include <vector>

#include "glaze_error.h"

namespace glaze {

// ============================================================================
// TemplateLoader
// ============================================================================

class TemplateLoader {
public:
    virtual ~TemplateLoader() {}

    // canonical path of `path` as referenced from `from_path` (may be empty)
    virtual std::string resolve(const std::string& path, const std::string& from_path) const = 0;

    // loads a resolved path; on failure fills `error` and returns false
    virtual bool load(const std::string& path, std::string* out_text, CompileError* error) const = 0;
};

// In-memory name -> source map. Paths are normalized like file paths.
class MemoryLoader : public TemplateLoader {
public:
    void add(const std::string& path, const std::string& source);

    std::string resolve(const std::string& path, const std::string& from_path) const override;
    bool load(const std::string& path, std::string* out_text, CompileError* error) const override;

private:
    std::map<std::string, std::string> templates_;
};

// Reads templates below a base directory.
class FileLoader : public TemplateLoader {
public:
    explicit FileLoader(const std::string& base_dir);

    std::string resolve(const std::string& path, const std::string& from_path) const override;
    bool load(const std::string& path, std::string* out_text, CompileError* error) const override;

    const std::string& base_dir() const { return base_dir_; }

private:
    std::string base_dir_;
};

// "a/./b/../c.s.php" -> "a/c.s.php"; `from_path`'s directory is the anchor
// for relative paths, a leading '/' anchors at the root
std::string resolve_template_path(const std::string& path, const std::string& from_path);

// ============================================================================
// DependencySink
// ============================================================================

class DependencySink {
public:
    virtual ~DependencySink() {}
    virtual void add_dependency(const std::string& path) = 0;
    virtual void add_component(const std::string& path) = 0;
};

// Collects reported paths in first-seen order without duplicates.
class DependencyList : public DependencySink {
public:
    void add_dependency(const std::string& path) override;
    void add_component(const std::string& path) override;

    const std::vector<std::string>& dependencies() const { return dependencies_; }
    const std::vector<std::string>& components() const { return components_; }

private:
    std::vector<std::string> dependencies_;
    std::vector<std::string> components_;
};

} // namespace glaze

#endif // GLAZE_LOADER_HPP

// line_index.hpp - byte offset to line/column lookup with a shared LRU cache

#ifndef GLAZE_LINE_INDEX_HPP
#define GLAZE_LINE_INDEX_HPP

#include <stdint.h>
#include <stddef.h>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace glaze {

// ============================================================================
// LineIndex
// ============================================================================

class LineIndex {
public:
    explicit LineIndex(const std::string& source);

    // 1-based line and column of byte `offset`; offsets past the end clamp
    void line_column_at(size_t offset, uint32_t* line, uint32_t* column) const;

    size_t line_count() const { return starts_.size(); }
    // byte offset where 1-based `line` starts, npos when out of range
    size_t line_start(uint32_t line) const;
    // byte offset of the line terminator (or source length)
    size_t line_end(uint32_t line) const;
    size_t source_length() const { return length_; }

private:
    std::vector<size_t> starts_;
    std::vector<size_t> ends_;
    size_t length_;
};

// ============================================================================
// LineIndexCache
// ============================================================================

// Process-wide cache keyed by (FNV-1a 64 of source, length). Least recently
// used entries are evicted once `capacity` is exceeded.
class LineIndexCache {
public:
    static const size_t DEFAULT_CAPACITY = 16;

    explicit LineIndexCache(size_t capacity = DEFAULT_CAPACITY);

    static LineIndexCache& shared();

    std::shared_ptr<const LineIndex> get(const std::string& source);
    size_t size() const;
    size_t capacity() const { return capacity_; }
    void clear();

    // number of lookups answered from cache, for tests
    size_t hits() const;

private:
    struct Key {
        uint64_t hash;
        size_t length;
        bool operator==(const Key& other) const {
            return hash == other.hash && length == other.length;
        }
    };
    struct KeyHash {
        size_t operator()(const Key& k) const {
            return (size_t)(k.hash ^ (k.length * 0x9e3779b97f4a7c15ull));
        }
    };
    struct Entry {
        Key key;
        std::shared_ptr<const LineIndex> index;
    };

    size_t capacity_;
    size_t hits_ = 0;
    std::list<Entry> order_;    // front = most recently used
    std::unordered_map<Key, std::list<Entry>::iterator, KeyHash> entries_;
    mutable std::mutex mutex_;
};

} // namespace glaze

#endif // GLAZE_LINE_INDEX_HPP

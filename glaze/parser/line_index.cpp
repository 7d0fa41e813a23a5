#include "line_index.hpp"
#include "../str_util.hpp"

#include <algorithm>

namespace glaze {

LineIndex::LineIndex(const std::string& source) : length_(source.size()) {
    starts_.push_back(0);
    for (size_t i = 0; i < source.size(); i++) {
        if (source[i] == '\n') {
            size_t end = i;
            if (end > starts_.back() && source[end - 1] == '\r') end--;
            ends_.push_back(end);
            starts_.push_back(i + 1);
        }
    }
    ends_.push_back(source.size());
}

void LineIndex::line_column_at(size_t offset, uint32_t* line, uint32_t* column) const {
    if (offset > length_) offset = length_;
    // last start <= offset
    auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
    size_t idx = (size_t)(it - starts_.begin()) - 1;
    if (line) *line = (uint32_t)(idx + 1);
    if (column) *column = (uint32_t)(offset - starts_[idx] + 1);
}

size_t LineIndex::line_start(uint32_t line) const {
    if (line == 0 || line > starts_.size()) return std::string::npos;
    return starts_[line - 1];
}

size_t LineIndex::line_end(uint32_t line) const {
    if (line == 0 || line > ends_.size()) return std::string::npos;
    return ends_[line - 1];
}

// ----------------------------------------------------------------------------

LineIndexCache::LineIndexCache(size_t capacity) : capacity_(capacity ? capacity : 1) {}

LineIndexCache& LineIndexCache::shared() {
    static LineIndexCache cache;
    return cache;
}

std::shared_ptr<const LineIndex> LineIndexCache::get(const std::string& source) {
    Key key{fnv1a_64(source.data(), source.size()), source.size()};
    std::lock_guard<std::mutex> lock(mutex_);

    auto found = entries_.find(key);
    if (found != entries_.end()) {
        hits_++;
        order_.splice(order_.begin(), order_, found->second);
        return found->second->index;
    }

    auto index = std::make_shared<const LineIndex>(source);
    order_.push_front(Entry{key, index});
    entries_[key] = order_.begin();
    while (order_.size() > capacity_) {
        entries_.erase(order_.back().key);
        order_.pop_back();
    }
    return index;
}

size_t LineIndexCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
}

size_t LineIndexCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

void LineIndexCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    order_.clear();
    entries_.clear();
    hits_ = 0;
}

} // namespace glaze

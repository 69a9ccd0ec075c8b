/**
 * FifoCache.hpp - Bounded key/value store evicting the oldest insertion
 *
 * Reads never refresh an entry's position. All operations lock an internal
 * mutex, so one instance may be shared between the input thread and the
 * analysis worker.
 */

#pragma once

#include <cstddef>
#include <iterator>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hint {

template <typename V>
class FifoCache {
public:
    explicit FifoCache(size_t max_size = 100) : max_size_(max_size == 0 ? 1 : max_size) {}

    std::optional<V> get(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        return it->second->second;
    }

    bool contains(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.count(key) > 0;
    }

    void set(const std::string& key, V value) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = index_.find(key);
        if (it != index_.end()) {
            // Overwrite in place; insertion position is kept
            it->second->second = std::move(value);
            return;
        }

        if (entries_.size() >= max_size_) {
            index_.erase(entries_.front().first);
            entries_.pop_front();
        }

        entries_.emplace_back(key, std::move(value));
        index_[key] = std::prev(entries_.end());
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        index_.clear();
    }

    // Removes every key starting with prefix; an empty prefix removes nothing
    size_t clearByPrefix(const std::string& prefix) {
        if (prefix.empty()) return 0;

        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->first.compare(0, prefix.size(), prefix) == 0) {
                index_.erase(it->first);
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    size_t maxSize() const { return max_size_; }

    // Keys oldest first
    std::vector<std::string> keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto& entry : entries_) {
            result.push_back(entry.first);
        }
        return result;
    }

private:
    using Entry = std::pair<std::string, V>;

    size_t max_size_;
    std::list<Entry> entries_;
    std::unordered_map<std::string, typename std::list<Entry>::iterator> index_;
    mutable std::mutex mutex_;
};

} // namespace hint

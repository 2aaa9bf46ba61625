#pragma once
// ═══════════════════════════════════════════════════════════════════
//  batchql/cache.h — Size-bounded LRU cache
// ═══════════════════════════════════════════════════════════════════
//  Holds parsed and validated query documents keyed by query text.
//  Shared by every request on a Graphql instance, hence the lock.
// ═══════════════════════════════════════════════════════════════════

#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace batchql::cache {

template <typename Key = std::string, typename Value = std::string>
class LRUCache {
public:
    explicit LRUCache(std::size_t maxSize) : maxSize_(maxSize) {}

    void set(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end()) {
            it->second->value = std::move(value);
            list_.splice(list_.begin(), list_, it->second);
            return;
        }
        list_.push_front(Entry{key, std::move(value)});
        map_[key] = list_.begin();
        evict();
    }

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) return std::nullopt;

        // Most recently used goes to the front.
        list_.splice(list_.begin(), list_, it->second);
        return it->second->value;
    }

    bool del(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) return false;
        list_.erase(it->second);
        map_.erase(it);
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        list_.clear();
        map_.clear();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.size();
    }

    std::size_t capacity() const { return maxSize_; }

private:
    struct Entry {
        Key key;
        Value value;
    };

    std::size_t maxSize_;
    std::list<Entry> list_;
    std::unordered_map<Key, typename std::list<Entry>::iterator> map_;
    mutable std::mutex mutex_;

    void evict() {
        while (map_.size() > maxSize_) {
            map_.erase(list_.back().key);
            list_.pop_back();
        }
    }
};

} // namespace batchql::cache

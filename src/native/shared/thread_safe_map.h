// thread_safe_map.h - Thread-safe map template
// Generic synchronized container backing the listener registries.
//
// This is a header-only implementation to avoid build complexity.

#ifndef WEBSHELL_THREAD_SAFE_MAP_H
#define WEBSHELL_THREAD_SAFE_MAP_H

#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace webshell {

// Thread-safe wrapper around std::map
// Values are returned by copy so callers never hold a reference past the lock
template<typename KeyType, typename ValueType>
class ThreadSafeMap {
public:
    ThreadSafeMap() = default;

    void set(const KeyType& key, ValueType value) {
        std::lock_guard<std::mutex> lock(mutex_);
        map_[key] = std::move(value);
    }

    bool remove(const KeyType& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.size();
    }

    // Snapshot of all values in key order
    // Lets callers iterate without holding the lock, so the callee may mutate the map
    std::vector<ValueType> values() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ValueType> result;
        result.reserve(map_.size());
        for (const auto& pair : map_) {
            result.push_back(pair.second);
        }
        return result;
    }

private:
    mutable std::mutex mutex_;
    std::map<KeyType, ValueType> map_;
};

} // namespace webshell

#endif // WEBSHELL_THREAD_SAFE_MAP_H

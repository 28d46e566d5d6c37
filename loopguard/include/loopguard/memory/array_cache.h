#pragma once

#include "loopguard/memory/cache_monitor.h"

#include <list>
#include <optional>
#include <string>
#include <unordered_map>

namespace loopguard {

/**
 * @brief In-memory string cache with insertion-order eviction
 *
 * Size is the sum of key and value lengths. clean() drops the oldest
 * quarter of the entries at a time until the target is met. Overwriting a
 * key keeps its original position.
 */
class ArrayCache : public ICacheMonitor {
public:
    ArrayCache() = default;

    [[nodiscard]] std::optional<std::string> get(const std::string& key);
    void set(const std::string& key, std::string value);
    [[nodiscard]] bool has(const std::string& key) const;
    bool remove(const std::string& key);

    [[nodiscard]] size_t count() const noexcept { return entries_.size(); }

    // ICacheMonitor
    [[nodiscard]] size_t size_bytes() const override { return size_bytes_; }
    void clean(size_t target_bytes) override;
    void clear() override;
    [[nodiscard]] CacheStats stats() const override;

private:
    struct Entry {
        std::string value;
        std::list<std::string>::iterator order;
    };

    std::unordered_map<std::string, Entry> entries_;
    std::list<std::string> order_;       ///< Oldest first
    size_t size_bytes_ = 0;
    size_t hits_ = 0;
    size_t misses_ = 0;

    void erase_oldest();
};

} // namespace loopguard

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>

namespace loopguard {

struct CacheStats {
    size_t size = 0;              ///< Bytes, same figure as size_bytes()
    size_t count = 0;             ///< Entries
    double hit_rate = 0.0;        ///< hits / (hits + misses), 0 without lookups
    size_t memory_usage = 0;
    size_t hits = 0;
    size_t misses = 0;

    [[nodiscard]] nlohmann::json to_json() const {
        return nlohmann::json{
            {"size", size},
            {"count", count},
            {"hit_rate", hit_rate},
            {"memory_usage", memory_usage},
            {"hits", hits},
            {"misses", misses}
        };
    }
};

/**
 * @brief Contract a cache implements to be watched by MemoryGuard
 *
 * The guard never touches entries itself. It reads the size and asks the
 * cache to shrink or empty itself.
 */
class ICacheMonitor {
public:
    virtual ~ICacheMonitor() = default;

    /// Approximate memory held by the entries, in bytes
    [[nodiscard]] virtual size_t size_bytes() const = 0;

    /**
     * @brief Evict entries until the cache holds at most `target_bytes`
     *
     * Which entries go is the cache's choice. A target of 0 is equivalent
     * to clear().
     */
    virtual void clean(size_t target_bytes) = 0;

    virtual void clear() = 0;

    [[nodiscard]] virtual CacheStats stats() const = 0;
};

} // namespace loopguard

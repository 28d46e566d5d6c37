#pragma once

#include "loopguard/memory/cache_monitor.h"

#include <functional>
#include <utility>

namespace loopguard {

/**
 * @brief Makes a standard or third-party container observable by MemoryGuard
 *
 * The adapter references a container it does not own. Eviction erases
 * from `begin()`, which is the oldest element for sequence containers and
 * the smallest key for ordered maps. Size defaults to
 * `size() * sizeof(value_type)`; pass an estimator when elements own heap
 * memory.
 *
 * @code
 * std::map<std::string, Session> sessions;
 * auto cache = std::make_shared<ContainerCache<std::map<std::string, Session>>>(sessions);
 * guard.register_cache("sessions", cache, 4 * MiB);
 * @endcode
 */
template<typename Container>
class ContainerCache : public ICacheMonitor {
public:
    using SizeEstimator = std::function<size_t(const Container&)>;

    explicit ContainerCache(Container& container, SizeEstimator estimator = {})
        : container_(container), estimator_(std::move(estimator)) {}

    [[nodiscard]] size_t size_bytes() const override {
        if (estimator_) {
            return estimator_(container_);
        }
        return container_.size() * sizeof(typename Container::value_type);
    }

    void clean(size_t target_bytes) override {
        while (!container_.empty() && size_bytes() > target_bytes) {
            container_.erase(container_.begin());
        }
    }

    void clear() override { container_.clear(); }

    [[nodiscard]] CacheStats stats() const override {
        CacheStats s;
        s.size = size_bytes();
        s.count = container_.size();
        s.memory_usage = s.size;
        return s;
    }

    [[nodiscard]] Container& container() noexcept { return container_; }

private:
    Container& container_;
    SizeEstimator estimator_;
};

} // namespace loopguard

#pragma once

#include "loopguard/memory/cache_monitor.h"
#include "loopguard/memory/memory_meter.h"
#include "loopguard/utils/logger.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace loopguard::fakes {

/**
 * @brief Memory meter whose readings are set by the test
 */
class FakeMemoryMeter : public IMemoryMeter {
public:
    size_t current = 0;
    size_t peak = 0;
    size_t freed_per_collect = 0;
    size_t collect_calls = 0;

    [[nodiscard]] size_t current_bytes() const override { return current; }
    [[nodiscard]] size_t peak_bytes() const override { return peak > current ? peak : current; }

    size_t collect() override {
        ++collect_calls;
        return freed_per_collect;
    }
};

/**
 * @brief Cache that records every request made by the guard
 */
class RecordingCache : public ICacheMonitor {
public:
    explicit RecordingCache(size_t initial_bytes = 0) : bytes(initial_bytes) {}

    size_t bytes = 0;
    std::vector<size_t> clean_targets;
    size_t clear_calls = 0;
    bool fail = false;

    [[nodiscard]] size_t size_bytes() const override { return bytes; }

    void clean(size_t target_bytes) override {
        clean_targets.push_back(target_bytes);
        if (fail) {
            throw std::runtime_error("clean exploded");
        }
        if (bytes > target_bytes) {
            bytes = target_bytes;
        }
    }

    void clear() override {
        ++clear_calls;
        if (fail) {
            throw std::runtime_error("clear exploded");
        }
        bytes = 0;
    }

    [[nodiscard]] CacheStats stats() const override {
        CacheStats s;
        s.size = bytes;
        s.memory_usage = bytes;
        return s;
    }
};

/**
 * @brief Logger writing only to `sink`, at every level
 */
inline std::shared_ptr<Logger> capture_logger(const std::string& component,
                                              const std::shared_ptr<MemorySink>& sink) {
    auto logger = std::make_shared<Logger>(component);
    logger->clear_sinks();
    logger->add_sink(sink);
    logger->set_level(LogLevel::TRACE);
    return logger;
}

/**
 * @brief Logger that drops everything
 */
inline std::shared_ptr<Logger> silent_logger(const std::string& component = "test") {
    auto logger = std::make_shared<Logger>(component);
    logger->clear_sinks();
    logger->set_level(LogLevel::OFF);
    return logger;
}

} // namespace loopguard::fakes

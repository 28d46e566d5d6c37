#include "loopguard/memory/array_cache.h"

#include <algorithm>

namespace loopguard {

std::optional<std::string> ArrayCache::get(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    return it->second.value;
}

void ArrayCache::set(const std::string& key, std::string value) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        size_bytes_ -= it->second.value.size();
        size_bytes_ += value.size();
        it->second.value = std::move(value);
        return;
    }

    order_.push_back(key);
    size_bytes_ += key.size() + value.size();
    entries_.emplace(key, Entry{std::move(value), std::prev(order_.end())});
}

bool ArrayCache::has(const std::string& key) const {
    return entries_.count(key) != 0;
}

bool ArrayCache::remove(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    size_bytes_ -= key.size() + it->second.value.size();
    order_.erase(it->second.order);
    entries_.erase(it);
    return true;
}

void ArrayCache::erase_oldest() {
    const std::string key = order_.front();
    remove(key);
}

void ArrayCache::clean(size_t target_bytes) {
    while (size_bytes_ > target_bytes && !entries_.empty()) {
        const size_t batch = std::max<size_t>(1, entries_.size() / 4);
        for (size_t i = 0; i < batch && !entries_.empty(); ++i) {
            erase_oldest();
        }
    }
}

void ArrayCache::clear() {
    entries_.clear();
    order_.clear();
    size_bytes_ = 0;
}

CacheStats ArrayCache::stats() const {
    CacheStats s;
    s.size = size_bytes_;
    s.count = entries_.size();
    s.memory_usage = size_bytes_;
    s.hits = hits_;
    s.misses = misses_;
    const size_t lookups = hits_ + misses_;
    s.hit_rate = lookups > 0 ? static_cast<double>(hits_) / static_cast<double>(lookups) : 0.0;
    return s;
}

} // namespace loopguard

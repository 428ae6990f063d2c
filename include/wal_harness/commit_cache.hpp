#pragma once

#include <wal_harness/configuration.hpp>
#include <wal_harness/types.hpp>

#include <folly/container/EvictingCacheMap.h>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace wal_harness {

// Recently committed heights and their block fingerprints.
// Least-recently-used entries are evicted once capacity is exceeded.
class commit_cache {
public:
    using entry = std::pair<std::uint64_t, bytes>;

    explicit commit_cache(std::size_t capacity = commit_cache_capacity)
        : _capacity(capacity), _cache(capacity) {}

    commit_cache(const commit_cache&) = delete;
    commit_cache& operator=(const commit_cache&) = delete;

    // Adds or replaces the entry and makes it the most recently used
    auto insert(std::uint64_t height, bytes fingerprint) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _cache.set(height, std::move(fingerprint));
    }

    // Looks up a fingerprint and marks it as most recently used
    auto get(std::uint64_t height) -> std::optional<bytes> {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _cache.find(height);
        if (it == _cache.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // Membership test without touching recency
    auto contains(std::uint64_t height) const -> bool {
        std::lock_guard<std::mutex> lock(_mutex);
        return _cache.exists(height);
    }

    // Retained entries, least recently used first. Reinserting them in this
    // order rebuilds the same recency order.
    auto entries() const -> std::vector<entry> {
        std::lock_guard<std::mutex> lock(_mutex);
        std::vector<entry> result;
        result.reserve(_cache.size());
        for (auto it = _cache.rbegin(); it != _cache.rend(); ++it) {
            result.emplace_back(it->first, it->second);
        }
        return result;
    }

    auto size() const -> std::size_t {
        std::lock_guard<std::mutex> lock(_mutex);
        return _cache.size();
    }

    auto capacity() const -> std::size_t { return _capacity; }

private:
    const std::size_t _capacity;
    folly::EvictingCacheMap<std::uint64_t, bytes> _cache;
    mutable std::mutex _mutex;
};

} // namespace wal_harness

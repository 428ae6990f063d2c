#pragma once

#include <wal_harness/exceptions.hpp>
#include <wal_harness/hex.hpp>
#include <wal_harness/types.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace wal_harness {

// Last height each node believes committed. No eviction.
class height_tracker {
public:
    using entry = std::pair<address, std::uint64_t>;

    height_tracker() = default;

    explicit height_tracker(const std::vector<node>& roster) {
        for (const auto& n : roster) {
            _heights.emplace(n._address, 0);
        }
    }

    height_tracker(const height_tracker&) = delete;
    height_tracker& operator=(const height_tracker&) = delete;

    auto set(const address& addr, std::uint64_t height) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _heights[addr] = height;
    }

    auto get(const address& addr) const -> std::optional<std::uint64_t> {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _heights.find(addr);
        if (it == _heights.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    auto size() const -> std::size_t {
        std::lock_guard<std::mutex> lock(_mutex);
        return _heights.size();
    }

    // Entries in roster order. Every roster member must be tracked.
    auto entries(const std::vector<node>& roster) const -> std::vector<entry> {
        std::lock_guard<std::mutex> lock(_mutex);
        std::vector<entry> result;
        result.reserve(roster.size());
        for (const auto& n : roster) {
            auto it = _heights.find(n._address);
            if (it == _heights.end()) {
                throw unknown_node_exception("No height tracked for " + to_hex(n._address));
            }
            result.emplace_back(it->first, it->second);
        }
        return result;
    }

private:
    address_map<std::uint64_t> _heights;
    mutable std::mutex _mutex;
};

} // namespace wal_harness

#pragma once

#include <wal_harness/exceptions.hpp>
#include <wal_harness/hex.hpp>
#include <wal_harness/membership_policy.hpp>
#include <wal_harness/types.hpp>

#include <algorithm>
#include <mutex>
#include <utility>
#include <vector>

namespace wal_harness {

// Full roster plus the simulated online subset.
// The roster is fixed at construction; the alive subset is replaced as a
// whole under its own lock.
template<membership_sampling_policy Policy = quorum_sampling_policy>
class membership_view {
public:
    explicit membership_view(std::vector<node> all_nodes, Policy policy = Policy{})
        : _all_nodes(std::move(all_nodes))
        , _policy(std::move(policy))
    {
        auto alive = _policy.sample(_all_nodes);
        require_members(alive);
        _alive_nodes = std::move(alive);
    }

    // Restores a previously captured alive subset
    membership_view(std::vector<node> all_nodes, std::vector<node> alive_nodes, Policy policy = Policy{})
        : _all_nodes(std::move(all_nodes))
        , _policy(std::move(policy))
    {
        require_members(alive_nodes);
        _alive_nodes = std::move(alive_nodes);
    }

    membership_view(const membership_view&) = delete;
    membership_view& operator=(const membership_view&) = delete;

    auto update_alive() -> std::vector<node> {
        std::lock_guard<std::mutex> lock(_mutex);
        auto alive = _policy.sample(_all_nodes);
        require_members(alive);
        _alive_nodes = alive;
        return alive;
    }

    auto set_alive(std::vector<node> alive_nodes) -> void {
        require_members(alive_nodes);
        std::lock_guard<std::mutex> lock(_mutex);
        _alive_nodes = std::move(alive_nodes);
    }

    auto all_nodes() const -> const std::vector<node>& { return _all_nodes; }

    auto alive_nodes() const -> std::vector<node> {
        std::lock_guard<std::mutex> lock(_mutex);
        return _alive_nodes;
    }

    auto is_alive(const address& addr) const -> bool {
        std::lock_guard<std::mutex> lock(_mutex);
        return std::any_of(_alive_nodes.begin(), _alive_nodes.end(),
                           [&addr](const node& n) { return n._address == addr; });
    }

    auto is_member(const address& addr) const -> bool {
        return std::any_of(_all_nodes.begin(), _all_nodes.end(),
                           [&addr](const node& n) { return n._address == addr; });
    }

private:
    const std::vector<node> _all_nodes;
    std::vector<node> _alive_nodes;
    Policy _policy;
    mutable std::mutex _mutex;

    auto require_members(const std::vector<node>& candidates) const -> void {
        for (const auto& candidate : candidates) {
            if (std::find(_all_nodes.begin(), _all_nodes.end(), candidate) == _all_nodes.end()) {
                throw membership_exception(
                    "Alive node is not in the roster: " + to_hex(candidate._address));
            }
        }
    }
};

} // namespace wal_harness

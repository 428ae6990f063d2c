#pragma once

#include <wal_harness/random.hpp>
#include <wal_harness/types.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <numeric>
#include <random>
#include <vector>

namespace wal_harness {

// Membership sampling policy concept
// Chooses which roster members are online for the next stretch of a test.
// The result must be a subset of the roster.
template<typename P>
concept membership_sampling_policy = requires(P policy, const std::vector<node>& roster) {
    { policy.sample(roster) } -> std::same_as<std::vector<node>>;
};

// Keeps a Byzantine quorum online: at least 2n/3 + 1 members, chosen at
// random. The sample preserves roster order.
class quorum_sampling_policy {
public:
    auto sample(const std::vector<node>& roster) -> std::vector<node> {
        if (roster.empty()) {
            return {};
        }

        auto total = roster.size();
        auto minimum = quorum_size(total);
        auto& rng = thread_rng();
        std::uniform_int_distribution<std::size_t> count_dist(minimum, total);
        auto count = count_dist(rng);

        std::vector<std::size_t> positions(total);
        std::iota(positions.begin(), positions.end(), std::size_t{0});
        std::shuffle(positions.begin(), positions.end(), rng);
        positions.resize(count);
        std::sort(positions.begin(), positions.end());

        std::vector<node> alive;
        alive.reserve(count);
        for (auto position : positions) {
            alive.push_back(roster[position]);
        }
        return alive;
    }

    static constexpr auto quorum_size(std::size_t total) -> std::size_t {
        return std::min(total, total * 2 / 3 + 1);
    }
};

// Every node stays online
class all_alive_policy {
public:
    auto sample(const std::vector<node>& roster) -> std::vector<node> {
        return roster;
    }
};

static_assert(membership_sampling_policy<quorum_sampling_policy>,
    "quorum_sampling_policy must satisfy membership_sampling_policy concept");
static_assert(membership_sampling_policy<all_alive_policy>,
    "all_alive_policy must satisfy membership_sampling_policy concept");

} // namespace wal_harness

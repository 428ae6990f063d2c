#pragma once

#include <wal_harness/types.hpp>

#include <cstddef>
#include <random>

namespace wal_harness {

// Per-thread generator seeded from the random device
inline auto thread_rng() -> std::mt19937_64& {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return rng;
}

inline auto generate_random_bytes(std::size_t size) -> bytes {
    std::uniform_int_distribution<int> byte_dist(0, 255);
    auto& rng = thread_rng();

    bytes result;
    result.reserve(size);
    for (std::size_t i = 0; i < size; ++i) {
        result.push_back(static_cast<std::byte>(byte_dist(rng)));
    }
    return result;
}

} // namespace wal_harness

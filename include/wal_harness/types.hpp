#pragma once

#include <boost/container_hash/hash.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace wal_harness {

using bytes = std::vector<std::byte>;

// Opaque node identity
using address = bytes;

struct bytes_hash {
    auto operator()(const bytes& value) const -> std::size_t {
        std::size_t seed = 0;
        for (auto b : value) {
            boost::hash_combine(seed, std::to_integer<unsigned char>(b));
        }
        return seed;
    }
};

// Per-node resources keyed by node address
template<typename T>
using address_map = std::unordered_map<address, T, bytes_hash>;

// Cluster member. Weights are carried through snapshots but not interpreted.
struct node {
    address _address;
    std::uint32_t _propose_weight{1};
    std::uint32_t _vote_weight{1};

    node() = default;
    explicit node(address addr) : _address(std::move(addr)) {}
    node(address addr, std::uint32_t propose_weight, std::uint32_t vote_weight)
        : _address(std::move(addr)), _propose_weight(propose_weight), _vote_weight(vote_weight) {}

    auto get_address() const -> const address& { return _address; }
    auto propose_weight() const -> std::uint32_t { return _propose_weight; }
    auto vote_weight() const -> std::uint32_t { return _vote_weight; }

    auto operator==(const node&) const -> bool = default;
};

// Proposed block content, opaque to the harness
struct block {
    std::uint64_t _height{0};
    bytes _payload;

    auto operator==(const block&) const -> bool = default;
};

// Consensus step recorded in the WAL
enum class step : std::uint8_t {
    propose,
    prevote,
    precommit,
    brake,
    commit
};

enum class vote_type : std::uint8_t {
    prevote,
    precommit
};

inline auto operator<<(std::ostream& os, step s) -> std::ostream& {
    switch (s) {
        case step::propose:   return os << "propose";
        case step::prevote:   return os << "prevote";
        case step::precommit: return os << "precommit";
        case step::brake:     return os << "brake";
        case step::commit:    return os << "commit";
    }
    return os << "unknown";
}

inline auto operator<<(std::ostream& os, vote_type v) -> std::ostream& {
    switch (v) {
        case vote_type::prevote:   return os << "prevote";
        case vote_type::precommit: return os << "precommit";
    }
    return os << "unknown";
}

struct aggregated_signature {
    bytes _signature;
    bytes _address_bitmap;

    auto operator==(const aggregated_signature&) const -> bool = default;
};

// Quorum certificate over a block hash
struct aggregated_vote {
    aggregated_signature _signature;
    vote_type _vote_type{vote_type::prevote};
    std::uint64_t _height{0};
    std::uint64_t _round{0};
    bytes _block_hash;
    address _leader;

    auto operator==(const aggregated_vote&) const -> bool = default;
};

// Certificate that a round was abandoned
struct aggregated_choke {
    std::uint64_t _height{0};
    std::uint64_t _round{0};
    bytes _signature;
    std::vector<address> _voters;

    auto operator==(const aggregated_choke&) const -> bool = default;
};

struct prevote_qc { aggregated_vote _vote; auto operator==(const prevote_qc&) const -> bool = default; };
struct precommit_qc { aggregated_vote _vote; auto operator==(const precommit_qc&) const -> bool = default; };
struct choke_qc { aggregated_choke _choke; auto operator==(const choke_qc&) const -> bool = default; };

// Certificate that moved the node into its current round
using update_from = std::variant<prevote_qc, precommit_qc, choke_qc>;

struct wal_lock {
    std::uint64_t _lock_round{0};
    aggregated_vote _lock_votes;
    block _content;

    auto operator==(const wal_lock&) const -> bool = default;
};

// Consensus state a node writes to its WAL
struct wal_info {
    std::uint64_t _height{0};
    std::uint64_t _round{0};
    step _step{step::propose};
    std::optional<wal_lock> _lock;
    update_from _from{prevote_qc{}};

    auto height() const -> std::uint64_t { return _height; }
    auto round() const -> std::uint64_t { return _round; }
    auto get_step() const -> step { return _step; }
    auto lock() const -> const std::optional<wal_lock>& { return _lock; }
    auto from() const -> const update_from& { return _from; }

    auto operator==(const wal_info&) const -> bool = default;
};

} // namespace wal_harness

#pragma once

#include <wal_harness/commit_cache.hpp>
#include <wal_harness/configuration.hpp>
#include <wal_harness/console_logger.hpp>
#include <wal_harness/exceptions.hpp>
#include <wal_harness/height_tracker.hpp>
#include <wal_harness/hex.hpp>
#include <wal_harness/logger.hpp>
#include <wal_harness/membership_policy.hpp>
#include <wal_harness/membership_view.hpp>
#include <wal_harness/mock_wal.hpp>
#include <wal_harness/random.hpp>
#include <wal_harness/snapshot.hpp>
#include <wal_harness/types.hpp>
#include <wal_harness/wal_codec.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace wal_harness {

// Runtime state of a simulated cluster that can be frozen to a file and
// rebuilt from it.
//
// The alive set, each node's WAL, the commit cache and the height tracker are
// guarded independently. save() locks them one after another, so a snapshot
// taken while node tasks are running may combine states from different
// instants.
//
// Fatal conditions (unwritable or unreadable file, malformed document, WAL
// blob that does not decode) are logged at critical level and thrown to the
// test driver.
template<diagnostic_logger Logger = console_logger,
         membership_sampling_policy Policy = quorum_sampling_policy>
class basic_record {
    // Restricts the restoring constructor to from_snapshot
    struct snapshot_key {
        explicit snapshot_key() = default;
    };

public:
    using logger_type = Logger;
    using policy_type = Policy;

    basic_record(std::size_t node_count, std::uint64_t interval)
        : basic_record(make_configuration(node_count, interval)) {}

    basic_record(std::size_t node_count, std::uint64_t interval,
                 Logger logger, Policy policy = Policy{})
        : basic_record(make_configuration(node_count, interval), std::move(logger), std::move(policy)) {}

    // Logs through a default logger filtered at the configured level
    explicit basic_record(const harness_configuration& config)
        : basic_record(config, make_logger(config.min_log_level())) {}

    basic_record(const harness_configuration& config, Logger logger, Policy policy = Policy{})
        : _logger(std::move(logger))
        , _interval(checked_interval(config))
        , _snapshot_path(config.snapshot_path())
        , _membership(generate_roster(config.node_count(), config.address_size()), std::move(policy))
        , _wals(empty_wals(_membership.all_nodes()))
        , _heights(_membership.all_nodes())
    {
        _commits.insert(0, generate_random_bytes(config.fingerprint_size()));

        auto nodes = std::to_string(_membership.all_nodes().size());
        auto alive = std::to_string(_membership.alive_nodes().size());
        _logger.debug("Created record", {{"nodes", nodes}, {"alive", alive}});
    }

    // Restores from a validated snapshot; reachable only through from_snapshot
    basic_record(snapshot_key, const record_snapshot& snap, std::string snapshot_path,
                 Logger logger, Policy policy)
        : _logger(std::move(logger))
        , _interval(snap._interval)
        , _snapshot_path(std::move(snapshot_path))
        , _membership(snap._node_record, snap._alive_record, std::move(policy))
        , _wals(restored_wals(snap, _codec))
    {
        for (const auto& [height, fingerprint] : snap._commit_record) {
            _commits.insert(height, fingerprint);
        }
        for (const auto& [addr, height] : snap._height_record) {
            _heights.set(addr, height);
        }
    }

    basic_record(const basic_record&) = delete;
    basic_record& operator=(const basic_record&) = delete;

    // Rebuilds a live record. Each decoded WAL state is re-encoded to the
    // bytes the consensus engine expects; commit entries are reinserted in
    // sequence order so recency is preserved.
    static auto from_snapshot(const record_snapshot& snap)
        -> std::unique_ptr<basic_record> {
        return from_snapshot(snap, make_logger(harness_configuration{}.min_log_level()));
    }

    static auto from_snapshot(const record_snapshot& snap, Logger logger, Policy policy = Policy{},
                              std::string snapshot_path = default_snapshot_path)
        -> std::unique_ptr<basic_record> {
        try {
            validate_snapshot(snap);
        } catch (const harness_exception& e) {
            logger.critical("Rejected record snapshot", {{"reason", e.what()}});
            throw;
        }
        return std::make_unique<basic_record>(
            snapshot_key{}, snap, std::move(snapshot_path), std::move(logger), std::move(policy));
    }

    // Reads the configured snapshot path, logging at the configured level
    static auto load(const harness_configuration& config) -> std::unique_ptr<basic_record> {
        return load(config.snapshot_path(), make_logger(config.min_log_level()));
    }

    static auto load(const std::string& path) -> std::unique_ptr<basic_record> {
        return load(path, make_logger(harness_configuration{}.min_log_level()));
    }

    static auto load(const std::string& path, Logger logger, Policy policy = Policy{})
        -> std::unique_ptr<basic_record> {
        std::ifstream in(path);
        if (!in) {
            logger.critical("Failed to open record snapshot", {{"path", path}});
            throw snapshot_io_exception("Cannot open snapshot file: " + path);
        }

        record_snapshot snap;
        try {
            snap = read_snapshot(in);
        } catch (const harness_exception& e) {
            logger.critical("Failed to parse record snapshot", {{"path", path}, {"reason", e.what()}});
            throw;
        }

        auto restored = from_snapshot(snap, std::move(logger), std::move(policy), path);
        auto nodes = std::to_string(snap._node_record.size());
        restored->_logger.info("Loaded record snapshot", {{"path", path}, {"nodes", nodes}});
        return restored;
    }

    // Writes to the path this record was configured with or loaded from
    auto save() -> void {
        save(_snapshot_path);
    }

    auto save(const std::string& path) -> void {
        record_snapshot snap;
        try {
            snap = to_snapshot();
        } catch (const harness_exception& e) {
            _logger.critical("Failed to capture record", {{"path", path}, {"reason", e.what()}});
            throw;
        }

        std::ofstream out(path, std::ios::out | std::ios::trunc);
        if (!out) {
            _logger.critical("Failed to create record snapshot", {{"path", path}});
            throw snapshot_io_exception("Cannot create snapshot file: " + path);
        }

        try {
            write_snapshot(out, snap);
            out.close();
            if (!out) {
                throw snapshot_io_exception("Cannot finish writing snapshot file: " + path);
            }
        } catch (const harness_exception& e) {
            _logger.critical("Failed to write record snapshot", {{"path", path}, {"reason", e.what()}});
            throw;
        }

        auto nodes = std::to_string(snap._node_record.size());
        auto commits = std::to_string(snap._commit_record.size());
        _logger.info("Saved record snapshot", {{"path", path}, {"nodes", nodes}, {"commits", commits}});
    }

    // Projects the live state into the canonical form, one structure at a time
    auto to_snapshot() const -> record_snapshot {
        const auto& roster = _membership.all_nodes();

        record_snapshot snap;
        snap._node_record = roster;
        snap._alive_record = _membership.alive_nodes();

        snap._wal_record.reserve(roster.size());
        for (const auto& n : roster) {
            auto blob = _wals.at(n._address)->peek();
            std::optional<wal_info> decoded;
            if (blob.has_value()) {
                try {
                    decoded = _codec.decode(*blob);
                } catch (const wal_decode_exception& e) {
                    throw wal_decode_exception(
                        "WAL of node " + to_hex(n._address) + " is corrupt: " + e.what());
                }
            }
            snap._wal_record.emplace_back(n._address, std::move(decoded));
        }

        snap._commit_record = _commits.entries();
        snap._height_record = _heights.entries(roster);
        snap._interval = _interval;
        return snap;
    }

    auto update_alive() -> std::vector<node> {
        auto alive = _membership.update_alive();
        auto count = std::to_string(alive.size());
        _logger.debug("Updated alive nodes", {{"alive", count}});
        return alive;
    }

    auto nodes() const -> const std::vector<node>& { return _membership.all_nodes(); }
    auto alive_nodes() const -> std::vector<node> { return _membership.alive_nodes(); }
    auto is_alive(const address& addr) const -> bool { return _membership.is_alive(addr); }

    // WAL handed to the consensus engine for this node
    auto wal(const address& addr) const -> std::shared_ptr<mock_wal> {
        auto it = _wals.find(addr);
        if (it == _wals.end()) {
            throw unknown_node_exception("No WAL for node " + to_hex(addr));
        }
        return it->second;
    }

    auto wal_at(std::size_t index) const -> std::shared_ptr<mock_wal> {
        const auto& roster = _membership.all_nodes();
        if (index >= roster.size()) {
            throw unknown_node_exception("Node index out of range: " + std::to_string(index));
        }
        return _wals.at(roster[index]._address);
    }

    auto insert_commit(std::uint64_t height, bytes fingerprint) -> void {
        _commits.insert(height, std::move(fingerprint));
    }

    auto commit_fingerprint(std::uint64_t height) -> std::optional<bytes> {
        return _commits.get(height);
    }

    auto commit_entries() const -> std::vector<commit_cache::entry> { return _commits.entries(); }
    auto commit_count() const -> std::size_t { return _commits.size(); }

    auto set_height(const address& addr, std::uint64_t height) -> void {
        if (!_membership.is_member(addr)) {
            throw unknown_node_exception("Cannot track height of unknown node " + to_hex(addr));
        }
        _heights.set(addr, height);
    }

    auto height_of(const address& addr) const -> std::optional<std::uint64_t> {
        return _heights.get(addr);
    }

    auto height_entries() const -> std::vector<height_tracker::entry> {
        return _heights.entries(_membership.all_nodes());
    }

    auto interval() const -> std::uint64_t { return _interval; }

    auto interval_duration() const -> wal_harness::interval_duration {
        return wal_harness::interval_duration(_interval);
    }

    auto snapshot_path() const -> const std::string& { return _snapshot_path; }

private:
    mutable Logger _logger;
    const std::uint64_t _interval;
    const std::string _snapshot_path;
    wal_codec _codec;
    membership_view<Policy> _membership;
    const address_map<std::shared_ptr<mock_wal>> _wals;
    commit_cache _commits;
    height_tracker _heights;

    static auto make_logger(log_level min_level) -> Logger {
        if constexpr (std::constructible_from<Logger, log_level>) {
            return Logger(min_level);
        } else {
            return Logger{};
        }
    }

    static auto make_configuration(std::size_t node_count, std::uint64_t interval) -> harness_configuration {
        harness_configuration config;
        config._node_count = node_count;
        config._interval_ms = interval;
        return config;
    }

    static auto checked_interval(const harness_configuration& config) -> std::uint64_t {
        validate(config);
        return config.interval_ms();
    }

    static auto generate_roster(std::size_t count, std::size_t address_size) -> std::vector<node> {
        std::unordered_set<address, bytes_hash> seen;
        std::vector<node> roster;
        roster.reserve(count);
        while (roster.size() < count) {
            auto addr = generate_random_bytes(address_size);
            if (seen.insert(addr).second) {
                roster.emplace_back(std::move(addr));
            }
        }
        return roster;
    }

    static auto empty_wals(const std::vector<node>& roster) -> address_map<std::shared_ptr<mock_wal>> {
        address_map<std::shared_ptr<mock_wal>> wals;
        for (const auto& n : roster) {
            wals.emplace(n._address, std::make_shared<mock_wal>());
        }
        return wals;
    }

    static auto restored_wals(const record_snapshot& snap, const wal_codec& codec)
        -> address_map<std::shared_ptr<mock_wal>> {
        address_map<std::shared_ptr<mock_wal>> wals;
        for (const auto& [addr, info] : snap._wal_record) {
            std::optional<bytes> blob;
            if (info.has_value()) {
                blob = codec.encode(*info);
            }
            wals.emplace(addr, std::make_shared<mock_wal>(std::move(blob)));
        }
        return wals;
    }

    // Every per-node sequence must cover the roster exactly once
    static auto validate_snapshot(const record_snapshot& snap) -> void {
        std::unordered_set<address, bytes_hash> roster;
        for (const auto& n : snap._node_record) {
            if (!roster.insert(n._address).second) {
                throw snapshot_format_exception("Duplicate node in roster: " + to_hex(n._address));
            }
        }

        for (const auto& n : snap._alive_record) {
            if (!roster.contains(n._address)) {
                throw snapshot_format_exception("Alive node is not in the roster: " + to_hex(n._address));
            }
        }

        auto require_cover = [&roster](const auto& sequence, const char* name) {
            std::unordered_set<address, bytes_hash> covered;
            for (const auto& item : sequence) {
                const auto& addr = item.first;
                if (!roster.contains(addr)) {
                    throw snapshot_format_exception(
                        std::string(name) + " names unknown node " + to_hex(addr));
                }
                if (!covered.insert(addr).second) {
                    throw snapshot_format_exception(
                        std::string(name) + " names node twice: " + to_hex(addr));
                }
            }
            if (covered.size() != roster.size()) {
                throw snapshot_format_exception(std::string(name) + " does not cover every node");
            }
        };
        require_cover(snap._wal_record, "wal_record");
        require_cover(snap._height_record, "height_record");

        if (snap._commit_record.size() > commit_cache_capacity) {
            throw snapshot_format_exception(
                "commit_record holds " + std::to_string(snap._commit_record.size()) +
                " entries, capacity is " + std::to_string(commit_cache_capacity));
        }
        std::unordered_set<std::uint64_t> heights;
        for (const auto& [height, fingerprint] : snap._commit_record) {
            if (!heights.insert(height).second) {
                throw snapshot_format_exception("Duplicate commit height: " + std::to_string(height));
            }
        }
    }
};

using record = basic_record<>;

} // namespace wal_harness

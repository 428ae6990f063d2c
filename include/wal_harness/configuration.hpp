#pragma once

#include <wal_harness/exceptions.hpp>
#include <wal_harness/logger.hpp>

#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>

namespace wal_harness {

// Fixture file the integration tests snapshot into by default
inline constexpr const char* default_snapshot_path = "./tests/integration_tests/test.json";

// Number of recent commits a record remembers
inline constexpr std::size_t commit_cache_capacity = 10;

// Simulation tick in unsigned milliseconds
using interval_duration = std::chrono::duration<std::uint64_t, std::milli>;

// Harness configuration concept
template<typename T>
concept harness_configuration_type = requires(const T& config) {
    { config.node_count() } -> std::same_as<std::size_t>;
    { config.interval_ms() } -> std::same_as<std::uint64_t>;
    { config.address_size() } -> std::same_as<std::size_t>;
    { config.fingerprint_size() } -> std::same_as<std::size_t>;
    { config.snapshot_path() } -> std::same_as<const std::string&>;
    { config.min_log_level() } -> std::same_as<log_level>;
};

// Default harness configuration
struct harness_configuration {
    std::size_t _node_count{4};
    std::uint64_t _interval_ms{3000};
    std::size_t _address_size{20};
    std::size_t _fingerprint_size{32};
    std::string _snapshot_path{default_snapshot_path};
    log_level _min_log_level{log_level::info};

    auto node_count() const -> std::size_t { return _node_count; }
    auto interval_ms() const -> std::uint64_t { return _interval_ms; }
    auto interval() const -> interval_duration { return interval_duration(_interval_ms); }
    auto address_size() const -> std::size_t { return _address_size; }
    auto fingerprint_size() const -> std::size_t { return _fingerprint_size; }
    auto snapshot_path() const -> const std::string& { return _snapshot_path; }
    auto min_log_level() const -> log_level { return _min_log_level; }
};

static_assert(harness_configuration_type<harness_configuration>,
    "harness_configuration must satisfy harness_configuration_type concept");

template<harness_configuration_type Config>
auto validate(const Config& config) -> void {
    if (config.node_count() == 0) {
        throw configuration_exception("node_count must be at least 1");
    }
    if (config.address_size() == 0) {
        throw configuration_exception("address_size must be at least 1 byte");
    }
    if (config.fingerprint_size() == 0) {
        throw configuration_exception("fingerprint_size must be at least 1 byte");
    }
    if (config.snapshot_path().empty()) {
        throw configuration_exception("snapshot_path must not be empty");
    }
}

} // namespace wal_harness

#pragma once

// Convenience header that includes all harness components

#include <wal_harness/commit_cache.hpp>
#include <wal_harness/configuration.hpp>
#include <wal_harness/console_logger.hpp>
#include <wal_harness/exceptions.hpp>
#include <wal_harness/height_tracker.hpp>
#include <wal_harness/hex.hpp>
#include <wal_harness/json_codec.hpp>
#include <wal_harness/logger.hpp>
#include <wal_harness/membership_policy.hpp>
#include <wal_harness/membership_view.hpp>
#include <wal_harness/mock_wal.hpp>
#include <wal_harness/random.hpp>
#include <wal_harness/record.hpp>
#include <wal_harness/snapshot.hpp>
#include <wal_harness/types.hpp>
#include <wal_harness/wal_codec.hpp>

namespace wal_harness {

inline constexpr int version_major = 0;
inline constexpr int version_minor = 1;
inline constexpr int version_patch = 0;

// Record that stays silent, for tests that only inspect state
using quiet_record = basic_record<null_logger>;

} // namespace wal_harness

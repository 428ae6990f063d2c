#pragma once

#include <wal_harness/types.hpp>

#include <folly/Unit.h>
#include <folly/futures/Future.h>

#include <concepts>
#include <mutex>
#include <optional>
#include <utility>

namespace wal_harness {

// Storage capability the consensus engine requires from a WAL backend.
// Failures are delivered through the returned future as a
// folly::exception_wrapper, never thrown from the call itself.
template<typename W>
concept write_ahead_log = requires(W wal, bytes info) {
    { wal.save(std::move(info)) } -> std::same_as<folly::Future<folly::Unit>>;
    { wal.load() } -> std::same_as<folly::Future<std::optional<bytes>>>;
};

// In-memory single-slot WAL. Each save replaces the previous state; nothing
// is retained beyond the most recent value.
class mock_wal {
public:
    mock_wal() = default;
    explicit mock_wal(std::optional<bytes> initial) : _inner(std::move(initial)) {}

    mock_wal(const mock_wal&) = delete;
    mock_wal& operator=(const mock_wal&) = delete;

    auto save(bytes info) -> folly::Future<folly::Unit> {
        restore(std::move(info));
        return folly::makeFuture(folly::Unit{});
    }

    auto load() -> folly::Future<std::optional<bytes>> {
        return folly::makeFuture(peek());
    }

    // Synchronous access used when projecting a record to and from a snapshot
    auto peek() const -> std::optional<bytes> {
        std::lock_guard<std::mutex> lock(_mutex);
        return _inner;
    }

    auto restore(std::optional<bytes> info) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _inner = std::move(info);
    }

private:
    std::optional<bytes> _inner;
    mutable std::mutex _mutex;
};

static_assert(write_ahead_log<mock_wal>, "mock_wal must satisfy write_ahead_log concept");

} // namespace wal_harness

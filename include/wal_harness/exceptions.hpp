#pragma once

#include <stdexcept>
#include <string>

namespace wal_harness {

// Base exception for all harness errors
class harness_exception : public std::runtime_error {
public:
    explicit harness_exception(const std::string& message)
        : std::runtime_error(message) {}
};

// Snapshot file could not be created, opened, written or read
class snapshot_io_exception : public harness_exception {
public:
    explicit snapshot_io_exception(const std::string& message)
        : harness_exception(message) {}
};

// Snapshot text could not be rendered or parsed back into the canonical form
class snapshot_format_exception : public harness_exception {
public:
    explicit snapshot_format_exception(const std::string& message)
        : harness_exception(message) {}
};

// A stored WAL blob is not a valid wal_info encoding
class wal_decode_exception : public harness_exception {
public:
    explicit wal_decode_exception(const std::string& message)
        : harness_exception(message) {}
};

// Reported by a storage capability through its returned future
class wal_storage_exception : public harness_exception {
public:
    explicit wal_storage_exception(const std::string& message)
        : harness_exception(message) {}
};

// Invalid harness_configuration values
class configuration_exception : public harness_exception {
public:
    explicit configuration_exception(const std::string& message)
        : harness_exception(message) {}
};

// Alive set names a node outside the roster
class membership_exception : public harness_exception {
public:
    explicit membership_exception(const std::string& message)
        : harness_exception(message) {}
};

// Lookup of an address that is not part of the roster
class unknown_node_exception : public harness_exception {
public:
    explicit unknown_node_exception(const std::string& message)
        : harness_exception(message) {}
};

} // namespace wal_harness

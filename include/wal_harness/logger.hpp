#pragma once

#include <concepts>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace wal_harness {

// Ordered from most to least verbose; loggers drop anything below their
// minimum level.
enum class log_level : std::uint8_t {
    trace,
    debug,
    info,
    warning,
    error,
    critical
};

// Context appended to a message, e.g. {{"path", path}, {"nodes", "4"}}.
// The views need only stay valid for the duration of the call.
using log_fields = std::vector<std::pair<std::string_view, std::string_view>>;

// What a record needs from its logger. Records report progress at info and
// debug, and report fatal snapshot errors at critical with the failure reason
// attached as a field, so the per-level calls must accept fields as well.
template<typename L>
concept diagnostic_logger = requires(L logger, log_level level, std::string_view message, log_fields fields) {
    { logger.log(level, message) } -> std::same_as<void>;
    { logger.log(level, message, fields) } -> std::same_as<void>;

    { logger.trace(message) } -> std::same_as<void>;
    { logger.debug(message) } -> std::same_as<void>;
    { logger.info(message) } -> std::same_as<void>;
    { logger.warning(message) } -> std::same_as<void>;
    { logger.error(message) } -> std::same_as<void>;
    { logger.critical(message) } -> std::same_as<void>;

    { logger.debug(message, fields) } -> std::same_as<void>;
    { logger.info(message, fields) } -> std::same_as<void>;
    { logger.critical(message, fields) } -> std::same_as<void>;
};

} // namespace wal_harness

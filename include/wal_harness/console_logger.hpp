#pragma once

#include <wal_harness/logger.hpp>

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace wal_harness {

[[nodiscard]] inline auto to_string(log_level level) -> std::string_view {
    switch (level) {
        case log_level::trace:    return "TRACE";
        case log_level::debug:    return "DEBUG";
        case log_level::info:     return "INFO";
        case log_level::warning:  return "WARNING";
        case log_level::error:    return "ERROR";
        case log_level::critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

// Accepts the names produced by to_string, in any case
[[nodiscard]] inline auto parse_log_level(std::string_view name) -> std::optional<log_level> {
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    for (auto level : {log_level::trace, log_level::debug, log_level::info,
                       log_level::warning, log_level::error, log_level::critical}) {
        if (upper == to_string(level)) {
            return level;
        }
    }
    return std::nullopt;
}

// Thread-safe timestamped logger. Messages at error and above go to the
// error stream, everything else to the output stream.
class console_logger {
public:
    explicit console_logger(log_level min_level = log_level::trace)
        : console_logger(min_level, std::cout, std::cerr) {}

    console_logger(log_level min_level, std::ostream& out, std::ostream& err)
        : _min_level(min_level), _out(&out), _err(&err) {}

    console_logger(console_logger&& other) noexcept
        : _min_level(other._min_level), _out(other._out), _err(other._err) {}

    console_logger& operator=(console_logger&& other) noexcept {
        if (this != &other) {
            _min_level = other._min_level;
            _out = other._out;
            _err = other._err;
        }
        return *this;
    }

    console_logger(const console_logger&) = delete;
    console_logger& operator=(const console_logger&) = delete;

    auto log(log_level level, std::string_view message) -> void {
        log(level, message, {});
    }

    auto log(log_level level, std::string_view message, const log_fields& key_value_pairs) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        if (level < _min_level) {
            return;
        }

        auto& stream = level >= log_level::error ? *_err : *_out;
        stream << format_timestamp() << " " << to_string(level) << ": " << message;
        for (const auto& [key, value] : key_value_pairs) {
            stream << " [" << key << "=" << value << "]";
        }
        stream << "\n";
        stream.flush();
    }

    auto trace(std::string_view message) -> void { log(log_level::trace, message); }
    auto trace(std::string_view message, const log_fields& fields) -> void { log(log_level::trace, message, fields); }

    auto debug(std::string_view message) -> void { log(log_level::debug, message); }
    auto debug(std::string_view message, const log_fields& fields) -> void { log(log_level::debug, message, fields); }

    auto info(std::string_view message) -> void { log(log_level::info, message); }
    auto info(std::string_view message, const log_fields& fields) -> void { log(log_level::info, message, fields); }

    auto warning(std::string_view message) -> void { log(log_level::warning, message); }
    auto warning(std::string_view message, const log_fields& fields) -> void { log(log_level::warning, message, fields); }

    auto error(std::string_view message) -> void { log(log_level::error, message); }
    auto error(std::string_view message, const log_fields& fields) -> void { log(log_level::error, message, fields); }

    auto critical(std::string_view message) -> void { log(log_level::critical, message); }
    auto critical(std::string_view message, const log_fields& fields) -> void { log(log_level::critical, message, fields); }

    auto set_min_level(log_level level) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _min_level = level;
    }

    [[nodiscard]] auto get_min_level() const -> log_level {
        std::lock_guard<std::mutex> lock(_mutex);
        return _min_level;
    }

private:
    log_level _min_level;
    std::ostream* _out;
    std::ostream* _err;
    mutable std::mutex _mutex;

    [[nodiscard]] static auto format_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ) % 1000;

        std::tm local{};
        localtime_r(&time_t_now, &local);

        std::ostringstream oss;
        oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }
};

// Discards every message
class null_logger {
public:
    auto log(log_level, std::string_view) -> void {}
    auto log(log_level, std::string_view, const log_fields&) -> void {}

    auto trace(std::string_view) -> void {}
    auto trace(std::string_view, const log_fields&) -> void {}
    auto debug(std::string_view) -> void {}
    auto debug(std::string_view, const log_fields&) -> void {}
    auto info(std::string_view) -> void {}
    auto info(std::string_view, const log_fields&) -> void {}
    auto warning(std::string_view) -> void {}
    auto warning(std::string_view, const log_fields&) -> void {}
    auto error(std::string_view) -> void {}
    auto error(std::string_view, const log_fields&) -> void {}
    auto critical(std::string_view) -> void {}
    auto critical(std::string_view, const log_fields&) -> void {}
};

static_assert(diagnostic_logger<console_logger>,
    "console_logger must satisfy diagnostic_logger concept");
static_assert(diagnostic_logger<null_logger>,
    "null_logger must satisfy diagnostic_logger concept");

} // namespace wal_harness

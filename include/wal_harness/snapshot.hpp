#pragma once

#include <wal_harness/exceptions.hpp>
#include <wal_harness/json_codec.hpp>
#include <wal_harness/types.hpp>

#include <boost/json.hpp>

#include <cstdint>
#include <istream>
#include <iterator>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace wal_harness {

// Ordered, serialization-friendly projection of a record. Every map is an
// explicit sequence of pairs so the rendered document has a stable shape.
// WAL blobs appear decoded; absent WALs stay absent.
struct record_snapshot {
    std::vector<node> _node_record;
    std::vector<node> _alive_record;
    std::vector<std::pair<address, std::optional<wal_info>>> _wal_record;
    std::vector<std::pair<std::uint64_t, bytes>> _commit_record;
    std::vector<std::pair<address, std::uint64_t>> _height_record;
    std::uint64_t _interval{0};

    auto operator==(const record_snapshot&) const -> bool = default;
};

inline void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const record_snapshot& snap) {
    boost::json::array wal_record;
    for (const auto& [addr, info] : snap._wal_record) {
        boost::json::value decoded = nullptr;
        if (info.has_value()) {
            decoded = boost::json::value_from(*info);
        }
        boost::json::array item;
        item.emplace_back(to_hex(addr));
        item.emplace_back(std::move(decoded));
        wal_record.emplace_back(std::move(item));
    }

    boost::json::array commit_record;
    for (const auto& [height, fingerprint] : snap._commit_record) {
        boost::json::array item;
        item.emplace_back(height);
        item.emplace_back(to_hex(fingerprint));
        commit_record.emplace_back(std::move(item));
    }

    boost::json::array height_record;
    for (const auto& [addr, height] : snap._height_record) {
        boost::json::array item;
        item.emplace_back(to_hex(addr));
        item.emplace_back(height);
        height_record.emplace_back(std::move(item));
    }

    boost::json::object obj;
    obj["node_record"] = boost::json::value_from(snap._node_record);
    obj["alive_record"] = boost::json::value_from(snap._alive_record);
    obj["wal_record"] = std::move(wal_record);
    obj["commit_record"] = std::move(commit_record);
    obj["height_record"] = std::move(height_record);
    obj["interval"] = snap._interval;
    jv = std::move(obj);
}

inline auto tag_invoke(boost::json::value_to_tag<record_snapshot>, const boost::json::value& jv) -> record_snapshot {
    const auto& obj = detail::expect_object(jv, "snapshot");

    record_snapshot snap;
    for (const auto& n : detail::expect_array(detail::field(obj, "node_record"), "node_record")) {
        snap._node_record.push_back(boost::json::value_to<node>(n));
    }
    for (const auto& n : detail::expect_array(detail::field(obj, "alive_record"), "alive_record")) {
        snap._alive_record.push_back(boost::json::value_to<node>(n));
    }

    for (const auto& item : detail::expect_array(detail::field(obj, "wal_record"), "wal_record")) {
        auto [addr, info] = detail::expect_pair(item, "wal_record[]");
        std::optional<wal_info> decoded;
        if (!info.is_null()) {
            decoded = boost::json::value_to<wal_info>(info);
        }
        snap._wal_record.emplace_back(detail::expect_hex(addr, "wal_record[].address"), std::move(decoded));
    }

    for (const auto& item : detail::expect_array(detail::field(obj, "commit_record"), "commit_record")) {
        auto [height, fingerprint] = detail::expect_pair(item, "commit_record[]");
        snap._commit_record.emplace_back(
            detail::expect_u64(height, "commit_record[].height"),
            detail::expect_hex(fingerprint, "commit_record[].fingerprint"));
    }

    for (const auto& item : detail::expect_array(detail::field(obj, "height_record"), "height_record")) {
        auto [addr, height] = detail::expect_pair(item, "height_record[]");
        snap._height_record.emplace_back(
            detail::expect_hex(addr, "height_record[].address"),
            detail::expect_u64(height, "height_record[].height"));
    }

    snap._interval = detail::expect_u64(detail::field(obj, "interval"), "interval");
    return snap;
}

inline auto write_snapshot(std::ostream& os, const record_snapshot& snap) -> void {
    write_pretty(os, boost::json::value_from(snap));
    if (!os) {
        throw snapshot_io_exception("Failed to write snapshot document");
    }
}

inline auto read_snapshot(std::istream& is) -> record_snapshot {
    std::string text{std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>()};
    if (is.bad()) {
        throw snapshot_io_exception("Failed to read snapshot document");
    }

    boost::json::error_code ec;
    auto jv = boost::json::parse(text, ec);
    if (ec) {
        throw snapshot_format_exception("Malformed snapshot document: " + ec.message());
    }
    return boost::json::value_to<record_snapshot>(jv);
}

} // namespace wal_harness

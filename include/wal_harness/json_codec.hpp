#pragma once

#include <wal_harness/exceptions.hpp>
#include <wal_harness/hex.hpp>
#include <wal_harness/types.hpp>

#include <boost/json.hpp>

#include <array>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace wal_harness {

namespace detail {

inline auto json_kind_error(std::string_view what, std::string_view expected) -> snapshot_format_exception {
    return snapshot_format_exception(std::string(what) + " must be " + std::string(expected));
}

inline auto expect_object(const boost::json::value& jv, std::string_view what) -> const boost::json::object& {
    if (!jv.is_object()) {
        throw json_kind_error(what, "an object");
    }
    return jv.get_object();
}

inline auto expect_array(const boost::json::value& jv, std::string_view what) -> const boost::json::array& {
    if (!jv.is_array()) {
        throw json_kind_error(what, "an array");
    }
    return jv.get_array();
}

inline auto expect_string(const boost::json::value& jv, std::string_view what) -> std::string_view {
    if (!jv.is_string()) {
        throw json_kind_error(what, "a string");
    }
    const auto& s = jv.get_string();
    return std::string_view(s.data(), s.size());
}

inline auto expect_u64(const boost::json::value& jv, std::string_view what) -> std::uint64_t {
    if (!jv.is_int64() && !jv.is_uint64()) {
        throw json_kind_error(what, "an unsigned integer");
    }
    boost::json::error_code ec;
    auto result = jv.to_number<std::uint64_t>(ec);
    if (ec) {
        throw json_kind_error(what, "an unsigned integer");
    }
    return result;
}

inline auto expect_u32(const boost::json::value& jv, std::string_view what) -> std::uint32_t {
    auto wide = expect_u64(jv, what);
    if (wide > std::numeric_limits<std::uint32_t>::max()) {
        throw json_kind_error(what, "a 32-bit unsigned integer");
    }
    return static_cast<std::uint32_t>(wide);
}

inline auto expect_hex(const boost::json::value& jv, std::string_view what) -> bytes {
    return from_hex(expect_string(jv, what));
}

inline auto field(const boost::json::object& obj, std::string_view key) -> const boost::json::value& {
    const auto* found = obj.if_contains(key);
    if (found == nullptr) {
        throw snapshot_format_exception("Missing field: " + std::string(key));
    }
    return *found;
}

// Two-element array used for the ordered key/value pairs of the snapshot
inline auto expect_pair(const boost::json::value& jv, std::string_view what)
    -> std::pair<const boost::json::value&, const boost::json::value&> {
    const auto& arr = expect_array(jv, what);
    if (arr.size() != 2) {
        throw json_kind_error(what, "a two-element array");
    }
    return {arr[0], arr[1]};
}

inline constexpr std::array<std::string_view, 5> step_names{
    "propose", "prevote", "precommit", "brake", "commit"};

inline constexpr std::array<std::string_view, 2> vote_type_names{"prevote", "precommit"};

template<typename Enum, std::size_t N>
auto parse_enum(const boost::json::value& jv, const std::array<std::string_view, N>& names,
                std::string_view what) -> Enum {
    auto text = expect_string(jv, what);
    for (std::size_t i = 0; i < N; ++i) {
        if (names[i] == text) {
            return static_cast<Enum>(i);
        }
    }
    throw snapshot_format_exception("Unknown " + std::string(what) + ": " + std::string(text));
}

} // namespace detail

// node

inline void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const node& n) {
    jv = {
        {"address", to_hex(n._address)},
        {"propose_weight", n._propose_weight},
        {"vote_weight", n._vote_weight}
    };
}

inline auto tag_invoke(boost::json::value_to_tag<node>, const boost::json::value& jv) -> node {
    const auto& obj = detail::expect_object(jv, "node");
    return node(
        detail::expect_hex(detail::field(obj, "address"), "node.address"),
        detail::expect_u32(detail::field(obj, "propose_weight"), "node.propose_weight"),
        detail::expect_u32(detail::field(obj, "vote_weight"), "node.vote_weight"));
}

// block

inline void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const block& b) {
    jv = {
        {"height", b._height},
        {"payload", to_hex(b._payload)}
    };
}

inline auto tag_invoke(boost::json::value_to_tag<block>, const boost::json::value& jv) -> block {
    const auto& obj = detail::expect_object(jv, "block");
    block b;
    b._height = detail::expect_u64(detail::field(obj, "height"), "block.height");
    b._payload = detail::expect_hex(detail::field(obj, "payload"), "block.payload");
    return b;
}

// aggregated_vote

inline void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const aggregated_vote& vote) {
    boost::json::object signature;
    signature["signature"] = to_hex(vote._signature._signature);
    signature["address_bitmap"] = to_hex(vote._signature._address_bitmap);

    boost::json::object obj;
    obj["signature"] = std::move(signature);
    obj["vote_type"] = detail::vote_type_names[static_cast<std::size_t>(vote._vote_type)];
    obj["height"] = vote._height;
    obj["round"] = vote._round;
    obj["block_hash"] = to_hex(vote._block_hash);
    obj["leader"] = to_hex(vote._leader);
    jv = std::move(obj);
}

inline auto tag_invoke(boost::json::value_to_tag<aggregated_vote>, const boost::json::value& jv) -> aggregated_vote {
    const auto& obj = detail::expect_object(jv, "aggregated_vote");
    const auto& signature = detail::expect_object(detail::field(obj, "signature"), "aggregated_vote.signature");

    aggregated_vote vote;
    vote._signature._signature = detail::expect_hex(detail::field(signature, "signature"), "signature.signature");
    vote._signature._address_bitmap = detail::expect_hex(detail::field(signature, "address_bitmap"), "signature.address_bitmap");
    vote._vote_type = detail::parse_enum<vote_type>(detail::field(obj, "vote_type"), detail::vote_type_names, "vote_type");
    vote._height = detail::expect_u64(detail::field(obj, "height"), "aggregated_vote.height");
    vote._round = detail::expect_u64(detail::field(obj, "round"), "aggregated_vote.round");
    vote._block_hash = detail::expect_hex(detail::field(obj, "block_hash"), "aggregated_vote.block_hash");
    vote._leader = detail::expect_hex(detail::field(obj, "leader"), "aggregated_vote.leader");
    return vote;
}

// aggregated_choke

inline void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const aggregated_choke& choke) {
    boost::json::array voters;
    for (const auto& voter : choke._voters) {
        voters.emplace_back(to_hex(voter));
    }

    jv = {
        {"height", choke._height},
        {"round", choke._round},
        {"signature", to_hex(choke._signature)},
        {"voters", std::move(voters)}
    };
}

inline auto tag_invoke(boost::json::value_to_tag<aggregated_choke>, const boost::json::value& jv) -> aggregated_choke {
    const auto& obj = detail::expect_object(jv, "aggregated_choke");
    aggregated_choke choke;
    choke._height = detail::expect_u64(detail::field(obj, "height"), "aggregated_choke.height");
    choke._round = detail::expect_u64(detail::field(obj, "round"), "aggregated_choke.round");
    choke._signature = detail::expect_hex(detail::field(obj, "signature"), "aggregated_choke.signature");
    for (const auto& voter : detail::expect_array(detail::field(obj, "voters"), "aggregated_choke.voters")) {
        choke._voters.push_back(detail::expect_hex(voter, "aggregated_choke.voters[]"));
    }
    return choke;
}

// wal_info. update_from is written as a single-key object naming the
// certificate kind.

inline void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const wal_info& info) {
    boost::json::object from;
    if (const auto* prevote = std::get_if<prevote_qc>(&info._from)) {
        from["prevote_qc"] = boost::json::value_from(prevote->_vote);
    } else if (const auto* precommit = std::get_if<precommit_qc>(&info._from)) {
        from["precommit_qc"] = boost::json::value_from(precommit->_vote);
    } else {
        from["choke_qc"] = boost::json::value_from(std::get<choke_qc>(info._from)._choke);
    }

    boost::json::object obj;
    obj["height"] = info._height;
    obj["round"] = info._round;
    obj["step"] = detail::step_names[static_cast<std::size_t>(info._step)];
    if (info._lock.has_value()) {
        boost::json::object lock;
        lock["lock_round"] = info._lock->_lock_round;
        lock["lock_votes"] = boost::json::value_from(info._lock->_lock_votes);
        lock["content"] = boost::json::value_from(info._lock->_content);
        obj["lock"] = std::move(lock);
    } else {
        obj["lock"] = nullptr;
    }
    obj["from"] = std::move(from);
    jv = std::move(obj);
}

inline auto tag_invoke(boost::json::value_to_tag<wal_info>, const boost::json::value& jv) -> wal_info {
    const auto& obj = detail::expect_object(jv, "wal_info");

    wal_info info;
    info._height = detail::expect_u64(detail::field(obj, "height"), "wal_info.height");
    info._round = detail::expect_u64(detail::field(obj, "round"), "wal_info.round");
    info._step = detail::parse_enum<step>(detail::field(obj, "step"), detail::step_names, "step");

    const auto& lock_value = detail::field(obj, "lock");
    if (!lock_value.is_null()) {
        const auto& lock_obj = detail::expect_object(lock_value, "wal_info.lock");
        wal_lock lock;
        lock._lock_round = detail::expect_u64(detail::field(lock_obj, "lock_round"), "wal_lock.lock_round");
        lock._lock_votes = boost::json::value_to<aggregated_vote>(detail::field(lock_obj, "lock_votes"));
        lock._content = boost::json::value_to<block>(detail::field(lock_obj, "content"));
        info._lock = std::move(lock);
    }

    const auto& from = detail::expect_object(detail::field(obj, "from"), "wal_info.from");
    if (from.size() != 1) {
        throw snapshot_format_exception("wal_info.from must name exactly one certificate");
    }
    const auto& [kind, certificate] = *from.begin();
    if (kind == "prevote_qc") {
        info._from = prevote_qc{boost::json::value_to<aggregated_vote>(certificate)};
    } else if (kind == "precommit_qc") {
        info._from = precommit_qc{boost::json::value_to<aggregated_vote>(certificate)};
    } else if (kind == "choke_qc") {
        info._from = choke_qc{boost::json::value_to<aggregated_choke>(certificate)};
    } else {
        throw snapshot_format_exception("Unknown certificate kind: " + std::string(kind));
    }
    return info;
}

// Indented rendering; boost::json::serialize only produces compact text
inline auto write_pretty(std::ostream& os, const boost::json::value& jv, std::string* indent = nullptr) -> void {
    std::string root_indent;
    if (indent == nullptr) {
        indent = &root_indent;
    }

    switch (jv.kind()) {
        case boost::json::kind::object: {
            const auto& obj = jv.get_object();
            if (obj.empty()) {
                os << "{}";
                break;
            }
            os << "{\n";
            indent->append(2, ' ');
            auto it = obj.begin();
            for (;;) {
                os << *indent << boost::json::serialize(it->key()) << ": ";
                write_pretty(os, it->value(), indent);
                if (++it == obj.end()) {
                    break;
                }
                os << ",\n";
            }
            os << "\n";
            indent->resize(indent->size() - 2);
            os << *indent << "}";
            break;
        }
        case boost::json::kind::array: {
            const auto& arr = jv.get_array();
            if (arr.empty()) {
                os << "[]";
                break;
            }
            os << "[\n";
            indent->append(2, ' ');
            auto it = arr.begin();
            for (;;) {
                os << *indent;
                write_pretty(os, *it, indent);
                if (++it == arr.end()) {
                    break;
                }
                os << ",\n";
            }
            os << "\n";
            indent->resize(indent->size() - 2);
            os << *indent << "]";
            break;
        }
        default:
            os << boost::json::serialize(jv);
            break;
    }

    if (indent->empty()) {
        os << "\n";
    }
}

} // namespace wal_harness

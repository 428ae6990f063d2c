#pragma once

#include <wal_harness/exceptions.hpp>
#include <wal_harness/types.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <variant>

namespace wal_harness {

// Conversion pair between a consensus state object and the bytes stored in a
// WAL. encode(decode(b)) must reproduce b for every b that decode accepts.
template<typename C, typename State>
concept wal_state_codec = requires(const C codec, const State& state, const bytes& data) {
    { codec.encode(state) } -> std::same_as<bytes>;
    { codec.decode(data) } -> std::same_as<State>;
};

// Canonical binary encoding of wal_info.
//
// Integers are fixed-width big-endian, byte strings and sequences carry a
// u32 length prefix, enums and the optional/variant discriminators are one
// byte. The decoder rejects out-of-range tags, truncated input and trailing
// bytes, so every accepted blob has exactly one encoding.
class wal_codec {
public:
    auto encode(const wal_info& info) const -> bytes {
        bytes out;
        put_u64(out, info._height);
        put_u64(out, info._round);
        put_u8(out, static_cast<std::uint8_t>(info._step));

        if (info._lock.has_value()) {
            put_u8(out, 1);
            put_u64(out, info._lock->_lock_round);
            put_vote(out, info._lock->_lock_votes);
            put_u64(out, info._lock->_content._height);
            put_bytes(out, info._lock->_content._payload);
        } else {
            put_u8(out, 0);
        }

        put_u8(out, static_cast<std::uint8_t>(info._from.index()));
        std::visit([&out](const auto& from) {
            using T = std::decay_t<decltype(from)>;
            if constexpr (std::same_as<T, choke_qc>) {
                put_choke(out, from._choke);
            } else {
                put_vote(out, from._vote);
            }
        }, info._from);

        return out;
    }

    auto decode(const bytes& data) const -> wal_info {
        reader in{data};
        wal_info info;
        info._height = in.u64();
        info._round = in.u64();
        info._step = in.enumerated<step>(step::commit, "step");

        switch (in.u8()) {
            case 0:
                break;
            case 1: {
                wal_lock lock;
                lock._lock_round = in.u64();
                lock._lock_votes = in.vote();
                lock._content._height = in.u64();
                lock._content._payload = in.byte_string();
                info._lock = std::move(lock);
                break;
            }
            default:
                throw wal_decode_exception("Invalid lock presence flag");
        }

        switch (in.u8()) {
            case 0:
                info._from = prevote_qc{in.vote()};
                break;
            case 1:
                info._from = precommit_qc{in.vote()};
                break;
            case 2:
                info._from = choke_qc{in.choke()};
                break;
            default:
                throw wal_decode_exception("Invalid update_from tag");
        }

        if (!in.exhausted()) {
            throw wal_decode_exception(
                "Trailing bytes after wal_info: " + std::to_string(in.remaining()));
        }
        return info;
    }

private:
    static auto put_u8(bytes& out, std::uint8_t value) -> void {
        out.push_back(static_cast<std::byte>(value));
    }

    static auto put_u32(bytes& out, std::uint32_t value) -> void {
        for (int shift = 24; shift >= 0; shift -= 8) {
            out.push_back(static_cast<std::byte>((value >> shift) & 0xFF));
        }
    }

    static auto put_u64(bytes& out, std::uint64_t value) -> void {
        for (int shift = 56; shift >= 0; shift -= 8) {
            out.push_back(static_cast<std::byte>((value >> shift) & 0xFF));
        }
    }

    static auto put_length(bytes& out, std::size_t length) -> void {
        if (length > std::numeric_limits<std::uint32_t>::max()) {
            throw snapshot_format_exception("Field too large to encode: " + std::to_string(length));
        }
        put_u32(out, static_cast<std::uint32_t>(length));
    }

    static auto put_bytes(bytes& out, const bytes& value) -> void {
        put_length(out, value.size());
        out.insert(out.end(), value.begin(), value.end());
    }

    static auto put_vote(bytes& out, const aggregated_vote& vote) -> void {
        put_bytes(out, vote._signature._signature);
        put_bytes(out, vote._signature._address_bitmap);
        put_u8(out, static_cast<std::uint8_t>(vote._vote_type));
        put_u64(out, vote._height);
        put_u64(out, vote._round);
        put_bytes(out, vote._block_hash);
        put_bytes(out, vote._leader);
    }

    static auto put_choke(bytes& out, const aggregated_choke& choke) -> void {
        put_u64(out, choke._height);
        put_u64(out, choke._round);
        put_bytes(out, choke._signature);
        put_length(out, choke._voters.size());
        for (const auto& voter : choke._voters) {
            put_bytes(out, voter);
        }
    }

    class reader {
    public:
        explicit reader(const bytes& data) : _data(data) {}

        auto u8() -> std::uint8_t {
            require(1);
            return std::to_integer<std::uint8_t>(_data[_pos++]);
        }

        auto u32() -> std::uint32_t {
            require(4);
            std::uint32_t value = 0;
            for (int i = 0; i < 4; ++i) {
                value = (value << 8) | std::to_integer<std::uint32_t>(_data[_pos++]);
            }
            return value;
        }

        auto u64() -> std::uint64_t {
            require(8);
            std::uint64_t value = 0;
            for (int i = 0; i < 8; ++i) {
                value = (value << 8) | std::to_integer<std::uint64_t>(_data[_pos++]);
            }
            return value;
        }

        template<typename Enum>
        auto enumerated(Enum last, const char* name) -> Enum {
            auto raw = u8();
            if (raw > static_cast<std::uint8_t>(last)) {
                throw wal_decode_exception(
                    std::string("Invalid ") + name + " value: " + std::to_string(raw));
            }
            return static_cast<Enum>(raw);
        }

        auto byte_string() -> bytes {
            auto length = u32();
            require(length);
            bytes value(_data.begin() + static_cast<std::ptrdiff_t>(_pos),
                        _data.begin() + static_cast<std::ptrdiff_t>(_pos + length));
            _pos += length;
            return value;
        }

        auto vote() -> aggregated_vote {
            aggregated_vote vote;
            vote._signature._signature = byte_string();
            vote._signature._address_bitmap = byte_string();
            vote._vote_type = enumerated<vote_type>(vote_type::precommit, "vote_type");
            vote._height = u64();
            vote._round = u64();
            vote._block_hash = byte_string();
            vote._leader = byte_string();
            return vote;
        }

        auto choke() -> aggregated_choke {
            aggregated_choke choke;
            choke._height = u64();
            choke._round = u64();
            choke._signature = byte_string();
            auto count = u32();
            // Each voter needs at least its length prefix
            if (count > remaining() / 4) {
                throw wal_decode_exception("Voter count exceeds remaining input");
            }
            choke._voters.reserve(count);
            for (std::uint32_t i = 0; i < count; ++i) {
                choke._voters.push_back(byte_string());
            }
            return choke;
        }

        auto remaining() const -> std::size_t { return _data.size() - _pos; }
        auto exhausted() const -> bool { return _pos == _data.size(); }

    private:
        const bytes& _data;
        std::size_t _pos{0};

        auto require(std::size_t count) const -> void {
            if (count > remaining()) {
                throw wal_decode_exception(
                    "Truncated wal_info: need " + std::to_string(count) +
                    " bytes, have " + std::to_string(remaining()));
            }
        }
    };
};

static_assert(wal_state_codec<wal_codec, wal_info>,
    "wal_codec must satisfy the wal_state_codec concept");

} // namespace wal_harness

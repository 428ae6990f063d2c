#pragma once

#include <wal_harness/exceptions.hpp>
#include <wal_harness/types.hpp>

#include <boost/algorithm/hex.hpp>

#include <iterator>
#include <string>
#include <string_view>

namespace wal_harness {

// Lowercase hex text with a 0x prefix
inline auto to_hex(const bytes& data) -> std::string {
    std::string raw;
    raw.reserve(data.size());
    for (auto b : data) {
        raw.push_back(static_cast<char>(std::to_integer<unsigned char>(b)));
    }

    std::string result = "0x";
    result.reserve(2 + raw.size() * 2);
    boost::algorithm::hex_lower(raw, std::back_inserter(result));
    return result;
}

// Accepts either case, with or without the 0x prefix
inline auto from_hex(std::string_view text) -> bytes {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }

    std::string raw;
    try {
        boost::algorithm::unhex(text.begin(), text.end(), std::back_inserter(raw));
    } catch (const boost::algorithm::hex_decode_error&) {
        throw snapshot_format_exception("Invalid hex text: " + std::string(text));
    }

    bytes result;
    result.reserve(raw.size());
    for (char c : raw) {
        result.push_back(static_cast<std::byte>(static_cast<unsigned char>(c)));
    }
    return result;
}

} // namespace wal_harness

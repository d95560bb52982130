#pragma once

#include "ipld/value.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ipld::easy {

namespace detail {
inline int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
} // namespace detail

// Accepts upper or lower case, optional whitespace between bytes.
inline Bytes bytes_from_hex(std::string_view hex) {
    Bytes out;
    out.reserve(hex.size() / 2);
    int hi = -1;
    for (char c : hex) {
        if (c == ' ' || c == '\n' || c == '\t' || c == '\r') {
            if (hi >= 0) throw CborError(ErrorKind::InvalidData, "odd number of hex digits");
            continue;
        }
        const int n = detail::hex_nibble(c);
        if (n < 0) throw CborError(ErrorKind::InvalidData, std::string("invalid hex digit '") + c + "'");
        if (hi < 0) {
            hi = n;
        } else {
            out.push_back(static_cast<std::uint8_t>((hi << 4) | n));
            hi = -1;
        }
    }
    if (hi >= 0) throw CborError(ErrorKind::InvalidData, "odd number of hex digits");
    return out;
}

inline std::string to_hex(const std::uint8_t* data, std::size_t len, bool upper = true) {
    const char* digits = upper ? "0123456789ABCDEF" : "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

inline std::string to_hex(const Bytes& b, bool upper = true) {
    return to_hex(b.data(), b.size(), upper);
}

inline Value map(std::initializer_list<std::pair<std::string, Value>> entries) {
    Value::Map m;
    for (const auto& kv : entries) {
        m.insert_or_assign(kv.first, kv.second);
    }
    return Value::make_map(std::move(m));
}

inline Value list(std::vector<Value> items) {
    return Value::make_list(std::move(items));
}

inline Value link(Bytes cid_bytes) {
    return Value::make_link(Cid{std::move(cid_bytes)});
}

inline Value text(std::string s) {
    return Value::make_string(std::move(s));
}

inline Value integer(Int128 i) {
    return Value::make_integer(i);
}

inline void set(Value::Map& root, std::string key, Value v) {
    root[std::move(key)] = std::move(v);
}

} // namespace ipld::easy

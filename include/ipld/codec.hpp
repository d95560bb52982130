#pragma once

#include "ipld/cbor.hpp"
#include "ipld/cid.hpp"
#include "ipld/value.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace ipld {

// ------------------------------
// Overload set
// ------------------------------
//
// Types take part in encode<T>/decode_as<T> by providing
//   void encode(Encoder&, const T&);
//   void decode(Decoder&, T&);
// in their own namespace. The overloads below cover the building blocks.

template <typename T>
inline constexpr bool is_plain_integer_v =
    std::is_integral_v<T> && !std::is_same_v<T, bool> &&
    !std::is_same_v<T, Int128> && !std::is_same_v<T, unsigned __int128>;

inline void encode(Encoder& e, bool v);
inline void decode(Decoder& d, bool& out);
template <typename T, std::enable_if_t<is_plain_integer_v<T>, int> = 0>
void encode(Encoder& e, T v);
template <typename T, std::enable_if_t<is_plain_integer_v<T>, int> = 0>
void decode(Decoder& d, T& out);
inline void encode(Encoder& e, Int128 v);
inline void decode(Decoder& d, Int128& out);
inline void encode(Encoder& e, double v);
inline void decode(Decoder& d, double& out);
inline void encode(Encoder& e, float v);
inline void decode(Decoder& d, float& out);
inline void encode(Encoder& e, const std::string& v);
inline void encode(Encoder& e, const char* v);
inline void decode(Decoder& d, std::string& out);
inline void encode(Encoder& e, const Bytes& v);
inline void decode(Decoder& d, Bytes& out);
template <typename T>
void encode(Encoder& e, const std::vector<T>& v);
template <typename T>
void decode(Decoder& d, std::vector<T>& out);
template <typename T>
void encode(Encoder& e, const std::map<std::string, T>& v);
template <typename T>
void decode(Decoder& d, std::map<std::string, T>& out);
template <typename T>
void encode(Encoder& e, const std::optional<T>& v);
template <typename T>
void decode(Decoder& d, std::optional<T>& out);

// ------------------------------
// Scalars
// ------------------------------

inline void encode(Encoder& e, bool v) { e.write_bool(v); }
inline void decode(Decoder& d, bool& out) { out = d.read_bool(); }

template <typename T, std::enable_if_t<is_plain_integer_v<T>, int>>
void encode(Encoder& e, T v) {
    if constexpr (std::is_signed_v<T>) {
        e.write_i64(static_cast<std::int64_t>(v));
    } else {
        e.write_u64(static_cast<std::uint64_t>(v));
    }
}

template <typename T, std::enable_if_t<is_plain_integer_v<T>, int>>
void decode(Decoder& d, T& out) {
    if constexpr (std::is_signed_v<T>) {
        const std::int64_t v = d.read_i64();
        if (v < static_cast<std::int64_t>((std::numeric_limits<T>::min)()) ||
            v > static_cast<std::int64_t>((std::numeric_limits<T>::max)())) {
            throw CborError(ErrorKind::OutOfRange, "integer out of range: " + std::to_string(v));
        }
        out = static_cast<T>(v);
    } else {
        const std::uint64_t v = d.read_u64();
        if (v > static_cast<std::uint64_t>((std::numeric_limits<T>::max)())) {
            throw CborError(ErrorKind::OutOfRange, "integer out of range: " + std::to_string(v));
        }
        out = static_cast<T>(v);
    }
}

inline void encode(Encoder& e, Int128 v) { e.write_i128(v); }
inline void decode(Decoder& d, Int128& out) { out = d.read_int(); }

inline void encode(Encoder& e, double v) { e.write_f64(v); }
inline void decode(Decoder& d, double& out) { out = d.read_f64(); }

inline void encode(Encoder& e, float v) { e.write_f64(static_cast<double>(v)); }
inline void decode(Decoder& d, float& out) { out = static_cast<float>(d.read_f64()); }

inline void encode(Encoder& e, const std::string& v) { e.write_text(v); }
inline void encode(Encoder& e, const char* v) { e.write_text(v); }
inline void decode(Decoder& d, std::string& out) { out = d.read_text(); }

inline void encode(Encoder& e, const Bytes& v) { e.write_bytes(v); }
inline void decode(Decoder& d, Bytes& out) { out = d.read_bytes(); }

// ------------------------------
// Containers
// ------------------------------

template <typename T>
void encode(Encoder& e, const std::vector<T>& v) {
    e.begin_array(static_cast<std::uint64_t>(v.size()));
    for (const auto& el : v) encode(e, el);
}

template <typename T>
void decode(Decoder& d, std::vector<T>& out) {
    const auto len = d.read_array_header();
    NestingGuard guard(d);
    out.clear();
    if (len) {
        // every element takes at least one byte
        out.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(*len, d.remaining())));
        for (std::uint64_t i = 0; i < *len; ++i) {
            T el{};
            decode(d, el);
            out.push_back(std::move(el));
        }
        return;
    }
    while (!d.at_break()) {
        T el{};
        decode(d, el);
        out.push_back(std::move(el));
    }
    d.consume_break();
}

template <typename T>
void encode(Encoder& e, const std::map<std::string, T>& v) {
    e.begin_map(static_cast<std::uint64_t>(v.size()));
    for (const auto& kv : v) {
        e.write_text(kv.first);
        encode(e, kv.second);
    }
}

template <typename T>
void decode(Decoder& d, std::map<std::string, T>& out) {
    const auto len = d.read_map_header();
    NestingGuard guard(d);
    out.clear();
    auto read_entry = [&]() {
        std::string key = d.read_text();
        T val{};
        decode(d, val);
        out.insert_or_assign(std::move(key), std::move(val));
    };
    if (len) {
        for (std::uint64_t i = 0; i < *len; ++i) read_entry();
        return;
    }
    while (!d.at_break()) read_entry();
    d.consume_break();
}

// null stands for an absent value
template <typename T>
void encode(Encoder& e, const std::optional<T>& v) {
    if (!v) {
        e.write_null();
        return;
    }
    encode(e, *v);
}

template <typename T>
void decode(Decoder& d, std::optional<T>& out) {
    if (d.peek_null()) {
        d.read_null();
        out.reset();
        return;
    }
    T val{};
    decode(d, val);
    out = std::move(val);
}

// ------------------------------
// Records
// ------------------------------

/// Walks a text-keyed map, calling `on_field(key, d)` for each entry. The
/// handler decodes the value and returns true, or returns false to have the
/// value skipped.
template <typename Handler>
void decode_record(Decoder& d, Handler&& on_field) {
    const auto len = d.read_map_header();
    NestingGuard guard(d);
    auto read_entry = [&]() {
        const std::string key = d.read_text();
        if (!on_field(key, d)) d.skip();
    };
    if (len) {
        for (std::uint64_t i = 0; i < *len; ++i) read_entry();
        return;
    }
    while (!d.at_break()) read_entry();
    d.consume_break();
}

inline void require_field(bool seen, const char* name) {
    if (!seen) {
        throw CborError(ErrorKind::MissingField, std::string("missing field `") + name + "`");
    }
}

// ------------------------------
// Entry points
// ------------------------------

template <typename T>
Bytes encode(const T& v) {
    Encoder e;
    encode(e, v);
    return e.take();
}

template <typename T>
T decode_as(const std::uint8_t* data, std::size_t len, const DecodeOptions& opts = DecodeOptions{}) {
    Decoder d(data, len, opts);
    T out{};
    decode(d, out);
    d.finish();
    return out;
}

template <typename T>
T decode_as(const Bytes& buf, const DecodeOptions& opts = DecodeOptions{}) {
    return decode_as<T>(buf.data(), buf.size(), opts);
}

} // namespace ipld

#pragma once

#include "ipld/cbor.hpp"
#include "ipld/cid.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ipld {

// ------------------------------
// Public data model
// ------------------------------

enum class ValueKind {
    Null,
    Bool,
    Integer,
    Float,
    String,
    Bytes,
    List,
    Map,
    Link,
};

std::string to_string(ValueKind k);

class Value {
public:
    using List = std::vector<Value>;
    // Iterates in key order; inserting an existing key replaces its value.
    using Map = std::map<std::string, Value>;

    using Storage = std::variant<
        std::nullptr_t,
        bool,
        Int128,
        double,
        std::string,
        Bytes,
        List,
        Map,
        Cid
    >;

    Value() = default;

    static Value make_null();
    static Value make_bool(bool b);
    static Value make_integer(Int128 i);
    static Value make_float(double f);
    static Value make_string(std::string s);
    static Value make_bytes(Bytes b);
    static Value make_list(List l);
    static Value make_map(Map m);
    static Value make_link(Cid c);

    ValueKind kind() const noexcept;

    bool is_null() const noexcept { return std::holds_alternative<std::nullptr_t>(v_); }
    bool is_bool() const noexcept { return std::holds_alternative<bool>(v_); }
    bool is_integer() const noexcept { return std::holds_alternative<Int128>(v_); }
    bool is_float() const noexcept { return std::holds_alternative<double>(v_); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(v_); }
    bool is_bytes() const noexcept { return std::holds_alternative<Bytes>(v_); }
    bool is_list() const noexcept { return std::holds_alternative<List>(v_); }
    bool is_map() const noexcept { return std::holds_alternative<Map>(v_); }
    bool is_link() const noexcept { return std::holds_alternative<Cid>(v_); }

    // Checked accessors; TypeMismatch on the wrong case.
    bool as_bool() const;
    Int128 as_integer() const;
    double as_float() const;
    const std::string& as_string() const;
    const Bytes& as_bytes() const;
    const List& as_list() const;
    const Map& as_map() const;
    const Cid& as_link() const;

    const Storage& storage() const noexcept { return v_; }

private:
    explicit Value(Storage s) : v_(std::move(s)) {}

    Storage v_{nullptr};
};

bool operator==(const Value& a, const Value& b);
bool operator!=(const Value& a, const Value& b);

/// CBOR diagnostic notation, e.g. {"details": 42(h'070809')}.
std::ostream& operator<<(std::ostream& os, const Value& v);
std::string to_diag(const Value& v);

// ------------------------------
// Decode dispatcher
// ------------------------------

/// Folds the events of exactly one item into a Value. Tag 42 around a byte
/// string becomes a Link; every other tag is rejected.
class ValueVisitor final : public Visitor {
public:
    void visit_null() override;
    void visit_bool(bool v) override;
    void visit_u64(std::uint64_t v) override;
    void visit_i64(std::int64_t v) override;
    void visit_i128(Int128 v) override;
    void visit_f64(double v) override;
    void visit_str(std::string_view v) override;
    void visit_string(std::string v) override;
    void visit_bytes(const std::uint8_t* data, std::size_t len) override;
    void visit_byte_buf(Bytes v) override;
    void visit_seq(SeqAccess& seq) override;
    void visit_map(MapAccess& map) override;
    void visit_tagged(std::optional<std::uint64_t> tag, Decoder& payload) override;

    /// Moves the produced value out, leaving Null behind.
    Value take();

private:
    Value out_{};
};

/// Decodes one item from `d` through ValueVisitor.
Value decode_value(Decoder& d);

/// Inverse of the dispatcher: Link goes out as tag 42 around its bytes.
void encode(Encoder& e, const Value& v);
void decode(Decoder& d, Value& out);

Value decode_as_value(const std::uint8_t* data, std::size_t len, const DecodeOptions& opts = DecodeOptions{});
Value decode_as_value(const Bytes& buf, const DecodeOptions& opts = DecodeOptions{});

} // namespace ipld

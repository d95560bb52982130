#include "ipld/value.hpp"

#include <cmath>
#include <iomanip>
#include <limits>
#include <locale>
#include <ostream>
#include <sstream>

namespace ipld {

std::string to_string(ValueKind k) {
    switch (k) {
        case ValueKind::Null: return "null";
        case ValueKind::Bool: return "bool";
        case ValueKind::Integer: return "integer";
        case ValueKind::Float: return "float";
        case ValueKind::String: return "string";
        case ValueKind::Bytes: return "bytes";
        case ValueKind::List: return "list";
        case ValueKind::Map: return "map";
        case ValueKind::Link: return "link";
        default: return "unknown";
    }
}

// ------------------------------
// Value helpers
// ------------------------------

Value Value::make_null() { return Value(Storage{nullptr}); }

Value Value::make_bool(bool b) { return Value(Storage{b}); }

Value Value::make_integer(Int128 i) { return Value(Storage{i}); }

Value Value::make_float(double f) { return Value(Storage{f}); }

Value Value::make_string(std::string s) { return Value(Storage{std::move(s)}); }

Value Value::make_bytes(Bytes b) { return Value(Storage{std::move(b)}); }

Value Value::make_list(List l) { return Value(Storage{std::move(l)}); }

Value Value::make_map(Map m) { return Value(Storage{std::move(m)}); }

Value Value::make_link(Cid c) { return Value(Storage{std::move(c)}); }

ValueKind Value::kind() const noexcept {
    return static_cast<ValueKind>(v_.index());
}

template <typename T>
static const T& checked_get(const Value::Storage& s, ValueKind want, ValueKind have) {
    if (!std::holds_alternative<T>(s)) {
        throw CborError(ErrorKind::TypeMismatch, "value is " + to_string(have) + ", not " + to_string(want));
    }
    return std::get<T>(s);
}

bool Value::as_bool() const { return checked_get<bool>(v_, ValueKind::Bool, kind()); }

Int128 Value::as_integer() const { return checked_get<Int128>(v_, ValueKind::Integer, kind()); }

double Value::as_float() const { return checked_get<double>(v_, ValueKind::Float, kind()); }

const std::string& Value::as_string() const { return checked_get<std::string>(v_, ValueKind::String, kind()); }

const Bytes& Value::as_bytes() const { return checked_get<Bytes>(v_, ValueKind::Bytes, kind()); }

const Value::List& Value::as_list() const { return checked_get<List>(v_, ValueKind::List, kind()); }

const Value::Map& Value::as_map() const { return checked_get<Map>(v_, ValueKind::Map, kind()); }

const Cid& Value::as_link() const { return checked_get<Cid>(v_, ValueKind::Link, kind()); }

bool operator==(const Value& a, const Value& b) { return a.storage() == b.storage(); }

bool operator!=(const Value& a, const Value& b) { return !(a == b); }

// ------------------------------
// Diagnostic notation
// ------------------------------

static void diag_escape_string(std::ostream& os, const std::string& s) {
    os << '"';
    for (unsigned char c : s) {
        switch (c) {
            case '"': os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\b': os << "\\b"; break;
            case '\f': os << "\\f"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if (c < 0x20) {
                    os << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec << std::setw(0);
                } else {
                    os << static_cast<char>(c);
                }
        }
    }
    os << '"';
}

static void diag_hex(std::ostream& os, const Bytes& b) {
    static const char* kDigits = "0123456789abcdef";
    os << "h'";
    for (std::uint8_t x : b) {
        os << kDigits[x >> 4] << kDigits[x & 0x0F];
    }
    os << '\'';
}

// Shortest decimal form that reads back to the same double.
static std::string diag_float(double v) {
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v < 0 ? "-Infinity" : "Infinity";

    std::string out;
    for (int prec = 1; prec <= std::numeric_limits<double>::max_digits10; ++prec) {
        std::ostringstream oss;
        oss.imbue(std::locale::classic());
        oss << std::setprecision(prec) << v;
        out = oss.str();
        std::istringstream iss(out);
        iss.imbue(std::locale::classic());
        double back = 0.0;
        iss >> back;
        if (back == v) break;
    }
    if (out.find_first_of(".e") == std::string::npos) out += ".0";
    return out;
}

static void diag_write(std::ostream& os, const Value& v) {
    switch (v.kind()) {
        case ValueKind::Null:
            os << "null";
            return;
        case ValueKind::Bool:
            os << (v.as_bool() ? "true" : "false");
            return;
        case ValueKind::Integer:
            os << to_string(v.as_integer());
            return;
        case ValueKind::Float:
            os << diag_float(v.as_float());
            return;
        case ValueKind::String:
            diag_escape_string(os, v.as_string());
            return;
        case ValueKind::Bytes:
            diag_hex(os, v.as_bytes());
            return;
        case ValueKind::List: {
            os << '[';
            bool first = true;
            for (const auto& el : v.as_list()) {
                if (!first) os << ", ";
                first = false;
                diag_write(os, el);
            }
            os << ']';
            return;
        }
        case ValueKind::Map: {
            os << '{';
            bool first = true;
            for (const auto& kv : v.as_map()) {
                if (!first) os << ", ";
                first = false;
                diag_escape_string(os, kv.first);
                os << ": ";
                diag_write(os, kv.second);
            }
            os << '}';
            return;
        }
        case ValueKind::Link:
            os << kCidTag << '(';
            diag_hex(os, v.as_link().bytes);
            os << ')';
            return;
    }
}

std::ostream& operator<<(std::ostream& os, const Value& v) {
    diag_write(os, v);
    return os;
}

std::string to_diag(const Value& v) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    diag_write(oss, v);
    return oss.str();
}

// ------------------------------
// Decode dispatcher
// ------------------------------

void ValueVisitor::visit_null() { out_ = Value::make_null(); }

void ValueVisitor::visit_bool(bool v) { out_ = Value::make_bool(v); }

void ValueVisitor::visit_u64(std::uint64_t v) { out_ = Value::make_integer(static_cast<Int128>(v)); }

void ValueVisitor::visit_i64(std::int64_t v) { out_ = Value::make_integer(static_cast<Int128>(v)); }

void ValueVisitor::visit_i128(Int128 v) { out_ = Value::make_integer(v); }

void ValueVisitor::visit_f64(double v) { out_ = Value::make_float(v); }

void ValueVisitor::visit_str(std::string_view v) { visit_string(std::string(v)); }

void ValueVisitor::visit_string(std::string v) { out_ = Value::make_string(std::move(v)); }

void ValueVisitor::visit_bytes(const std::uint8_t* data, std::size_t len) {
    visit_byte_buf(Bytes(data, data + len));
}

void ValueVisitor::visit_byte_buf(Bytes v) { out_ = Value::make_bytes(std::move(v)); }

void ValueVisitor::visit_seq(SeqAccess& seq) {
    Value::List list;
    ValueVisitor elem;
    while (seq.next_element(elem)) {
        list.push_back(elem.take());
    }
    out_ = Value::make_list(std::move(list));
}

void ValueVisitor::visit_map(MapAccess& map) {
    Value::Map values;
    std::string key;
    ValueVisitor elem;
    while (map.next_key(key)) {
        map.next_value(elem);
        values.insert_or_assign(std::move(key), elem.take());
    }
    out_ = Value::make_map(std::move(values));
}

void ValueVisitor::visit_tagged(std::optional<std::uint64_t> tag, Decoder& payload) {
    // The decoder only gets here after reading a tag head, so a missing tag
    // means the caller broke the protocol.
    if (!tag) {
        throw CborError(ErrorKind::TagPolicy, "tag expected");
    }
    if (*tag != kCidTag) {
        throw CborError(ErrorKind::UnexpectedTag, "unexpected tag (" + std::to_string(*tag) + ")");
    }
    Value inner = decode_value(payload);
    if (!inner.is_bytes()) {
        throw CborError(ErrorKind::TagPolicy, "bytes expected");
    }
    out_ = Value::make_link(Cid{inner.as_bytes()});
}

Value ValueVisitor::take() {
    Value out = std::move(out_);
    out_ = Value::make_null();
    return out;
}

Value decode_value(Decoder& d) {
    ValueVisitor visitor;
    d.decode_any(visitor);
    return visitor.take();
}

// ------------------------------
// Encode
// ------------------------------

void encode(Encoder& e, const Value& v) {
    switch (v.kind()) {
        case ValueKind::Null:
            e.write_null();
            return;
        case ValueKind::Bool:
            e.write_bool(v.as_bool());
            return;
        case ValueKind::Integer:
            e.write_i128(v.as_integer());
            return;
        case ValueKind::Float:
            e.write_f64(v.as_float());
            return;
        case ValueKind::String:
            e.write_text(v.as_string());
            return;
        case ValueKind::Bytes:
            e.write_bytes(v.as_bytes());
            return;
        case ValueKind::List: {
            const auto& list = v.as_list();
            e.begin_array(static_cast<std::uint64_t>(list.size()));
            for (const auto& el : list) encode(e, el);
            return;
        }
        case ValueKind::Map: {
            const auto& map = v.as_map();
            e.begin_map(static_cast<std::uint64_t>(map.size()));
            for (const auto& kv : map) {
                e.write_text(kv.first);
                encode(e, kv.second);
            }
            return;
        }
        case ValueKind::Link:
            encode(e, v.as_link());
            return;
    }
    throw CborError(ErrorKind::InvalidData, "unsupported value variant");
}

void decode(Decoder& d, Value& out) { out = decode_value(d); }

Value decode_as_value(const std::uint8_t* data, std::size_t len, const DecodeOptions& opts) {
    Decoder d(data, len, opts);
    Value v = decode_value(d);
    d.finish();
    return v;
}

Value decode_as_value(const Bytes& buf, const DecodeOptions& opts) {
    return decode_as_value(buf.data(), buf.size(), opts);
}

} // namespace ipld

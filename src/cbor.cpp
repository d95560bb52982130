#include "ipld/cbor.hpp"

#include <cmath>
#include <cstring>
#include <limits>

namespace ipld {

CborError::CborError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

ErrorKind CborError::kind() const noexcept { return kind_; }

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Io: return "io";
        case ErrorKind::Truncated: return "truncated";
        case ErrorKind::InvalidData: return "invalid data";
        case ErrorKind::InvalidUtf8: return "invalid utf-8";
        case ErrorKind::TrailingData: return "trailing data";
        case ErrorKind::DepthLimit: return "depth limit";
        case ErrorKind::TypeMismatch: return "type mismatch";
        case ErrorKind::MissingField: return "missing field";
        case ErrorKind::OutOfRange: return "out of range";
        case ErrorKind::UnexpectedTag: return "unexpected tag";
        case ErrorKind::TagPolicy: return "tag policy";
        case ErrorKind::ZlibError: return "zlib";
        default: return "unknown";
    }
}

std::string to_string(MajorType t) {
    switch (t) {
        case MajorType::Unsigned: return "unsigned integer";
        case MajorType::Negative: return "negative integer";
        case MajorType::ByteString: return "byte string";
        case MajorType::TextString: return "text string";
        case MajorType::Array: return "array";
        case MajorType::Map: return "map";
        case MajorType::Tag: return "tag";
        case MajorType::Simple: return "simple value";
        default: return "unknown";
    }
}

// ------------------------------
// Small helpers
// ------------------------------

static constexpr std::uint8_t kBreak = 0xFF;
static constexpr std::uint64_t kMaxI64 = static_cast<std::uint64_t>((std::numeric_limits<std::int64_t>::max)());

static void append_be(Bytes& out, std::uint64_t v, std::size_t n) {
    for (std::size_t i = n; i > 0; --i) {
        out.push_back(static_cast<std::uint8_t>((v >> (8 * (i - 1))) & 0xFFu));
    }
}

double half_to_double(std::uint16_t half) {
    const int exp = (half >> 10) & 0x1F;
    const int mant = half & 0x3FF;
    double val = 0.0;
    if (exp == 0) {
        val = std::ldexp(static_cast<double>(mant), -24);
    } else if (exp != 31) {
        val = std::ldexp(static_cast<double>(mant + 1024), exp - 25);
    } else {
        val = mant == 0 ? std::numeric_limits<double>::infinity()
                        : std::numeric_limits<double>::quiet_NaN();
    }
    return (half & 0x8000) ? -val : val;
}

// Half-precision bits for `f` when the conversion loses nothing.
static bool float_to_half_exact(float f, std::uint16_t& out) {
    std::uint32_t bits = 0;
    std::memcpy(&bits, &f, sizeof(bits));
    const auto sign = static_cast<std::uint16_t>((bits >> 16) & 0x8000u);
    const std::uint32_t abs = bits & 0x7FFFFFFFu;

    if (abs == 0) {
        out = sign;
        return true;
    }
    if (abs == 0x7F800000u) {
        out = static_cast<std::uint16_t>(sign | 0x7C00u);
        return true;
    }

    const int exp = static_cast<int>(abs >> 23) - 127;
    std::uint32_t mant = abs & 0x7FFFFFu;
    if (exp > 15 || exp < -24) return false;

    if (exp >= -14) {
        if (mant & 0x1FFFu) return false;
        out = static_cast<std::uint16_t>(sign | ((exp + 15) << 10) | (mant >> 13));
        return true;
    }

    // subnormal half: value = m * 2^-24
    mant |= 0x800000u;
    const int shift = -(exp + 1);
    if (mant & ((1u << shift) - 1u)) return false;
    out = static_cast<std::uint16_t>(sign | (mant >> shift));
    return true;
}

std::string to_string(Int128 v) {
    if (v == 0) return "0";
    const bool neg = v < 0;
    // work on the negative side so INT128_MIN does not overflow
    Int128 n = neg ? v : -v;
    std::string out;
    while (n != 0) {
        out.push_back(static_cast<char>('0' - static_cast<int>(n % 10)));
        n /= 10;
    }
    if (neg) out.push_back('-');
    return std::string(out.rbegin(), out.rend());
}

bool is_valid_utf8(const char* s, std::size_t len) noexcept {
    const auto* p = reinterpret_cast<const unsigned char*>(s);
    std::size_t i = 0;
    while (i < len) {
        const unsigned char c = p[i];
        if (c < 0x80) {
            ++i;
            continue;
        }
        std::size_t n = 0;
        std::uint32_t cp = 0;
        if ((c & 0xE0) == 0xC0) { n = 1; cp = c & 0x1Fu; }
        else if ((c & 0xF0) == 0xE0) { n = 2; cp = c & 0x0Fu; }
        else if ((c & 0xF8) == 0xF0) { n = 3; cp = c & 0x07u; }
        else return false;

        if (len - i - 1 < n) return false;
        for (std::size_t k = 1; k <= n; ++k) {
            const unsigned char cc = p[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3Fu);
        }
        // overlong forms
        if ((n == 1 && cp < 0x80) || (n == 2 && cp < 0x800) || (n == 3 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += n + 1;
    }
    return true;
}

namespace {

// Consumes one item of any shape without building anything.
class IgnoreVisitor final : public Visitor {
public:
    void visit_null() override {}
    void visit_bool(bool) override {}
    void visit_u64(std::uint64_t) override {}
    void visit_i64(std::int64_t) override {}
    void visit_i128(Int128) override {}
    void visit_f64(double) override {}
    void visit_str(std::string_view) override {}
    void visit_string(std::string) override {}
    void visit_bytes(const std::uint8_t*, std::size_t) override {}
    void visit_byte_buf(Bytes) override {}

    void visit_seq(SeqAccess& seq) override {
        while (seq.next_element(*this)) {}
    }

    void visit_map(MapAccess& map) override {
        while (map.next_key_any(*this)) {
            map.next_value(*this);
        }
    }

    void visit_tagged(std::optional<std::uint64_t>, Decoder& payload) override {
        payload.decode_any(*this);
    }
};

} // namespace

// ------------------------------
// Encoder
// ------------------------------

void Encoder::write_head(MajorType major, std::uint64_t arg) {
    const auto mt = static_cast<std::uint8_t>(static_cast<std::uint8_t>(major) << 5);
    if (arg < 24) {
        out_.push_back(static_cast<std::uint8_t>(mt | arg));
    } else if (arg <= 0xFFu) {
        out_.push_back(static_cast<std::uint8_t>(mt | 24));
        append_be(out_, arg, 1);
    } else if (arg <= 0xFFFFu) {
        out_.push_back(static_cast<std::uint8_t>(mt | 25));
        append_be(out_, arg, 2);
    } else if (arg <= 0xFFFFFFFFu) {
        out_.push_back(static_cast<std::uint8_t>(mt | 26));
        append_be(out_, arg, 4);
    } else {
        out_.push_back(static_cast<std::uint8_t>(mt | 27));
        append_be(out_, arg, 8);
    }
}

void Encoder::write_null() { out_.push_back(0xF6); }

void Encoder::write_bool(bool v) { out_.push_back(v ? 0xF5 : 0xF4); }

void Encoder::write_u64(std::uint64_t v) { write_head(MajorType::Unsigned, v); }

void Encoder::write_i64(std::int64_t v) {
    if (v >= 0) {
        write_head(MajorType::Unsigned, static_cast<std::uint64_t>(v));
    } else {
        write_head(MajorType::Negative, static_cast<std::uint64_t>(-(v + 1)));
    }
}

void Encoder::write_i128(Int128 v) {
    constexpr Int128 kMaxU64 = static_cast<Int128>((std::numeric_limits<std::uint64_t>::max)());
    if (v >= 0) {
        if (v > kMaxU64) throw CborError(ErrorKind::OutOfRange, "integer too large for CBOR: " + to_string(v));
        write_head(MajorType::Unsigned, static_cast<std::uint64_t>(v));
        return;
    }
    const Int128 n = -1 - v;
    if (n > kMaxU64) throw CborError(ErrorKind::OutOfRange, "integer too small for CBOR: " + to_string(v));
    write_head(MajorType::Negative, static_cast<std::uint64_t>(n));
}

void Encoder::write_f64(double v) {
    if (!std::isnan(v) && (std::isinf(v) || std::fabs(v) <= static_cast<double>((std::numeric_limits<float>::max)()))) {
        const float f = static_cast<float>(v);
        if (static_cast<double>(f) == v) {
            std::uint16_t half = 0;
            if (float_to_half_exact(f, half)) {
                out_.push_back(0xF9);
                append_be(out_, half, 2);
                return;
            }
            std::uint32_t bits = 0;
            std::memcpy(&bits, &f, sizeof(bits));
            out_.push_back(0xFA);
            append_be(out_, bits, 4);
            return;
        }
    }
    // NaN payloads are written as-is.
    std::uint64_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    out_.push_back(0xFB);
    append_be(out_, bits, 8);
}

void Encoder::write_text(std::string_view s) {
    write_head(MajorType::TextString, static_cast<std::uint64_t>(s.size()));
    out_.insert(out_.end(), s.begin(), s.end());
}

void Encoder::write_bytes(const std::uint8_t* data, std::size_t len) {
    write_head(MajorType::ByteString, static_cast<std::uint64_t>(len));
    if (len) out_.insert(out_.end(), data, data + len);
}

void Encoder::write_bytes(const Bytes& b) { write_bytes(b.data(), b.size()); }

void Encoder::write_tag(std::uint64_t tag) { write_head(MajorType::Tag, tag); }

void Encoder::write_tagged_bytes(std::uint64_t tag, const std::uint8_t* data, std::size_t len) {
    write_tag(tag);
    write_bytes(data, len);
}

void Encoder::begin_array(std::uint64_t n) { write_head(MajorType::Array, n); }

void Encoder::begin_map(std::uint64_t n) { write_head(MajorType::Map, n); }

void Encoder::begin_indefinite_array() { out_.push_back(0x9F); }

void Encoder::begin_indefinite_map() { out_.push_back(0xBF); }

void Encoder::write_break() { out_.push_back(kBreak); }

Bytes Encoder::take() {
    Bytes out = std::move(out_);
    out_.clear();
    return out;
}

// ------------------------------
// Container access
// ------------------------------

SeqAccess::SeqAccess(Decoder& d, std::optional<std::uint64_t> len)
    : d_(d), remaining_(len) {}

bool SeqAccess::next_element(Visitor& v) {
    if (done_) return false;
    if (remaining_) {
        if (*remaining_ == 0) {
            done_ = true;
            return false;
        }
        --*remaining_;
    } else if (d_.at_break()) {
        d_.consume_break();
        done_ = true;
        return false;
    }
    d_.decode_any(v);
    return true;
}

void SeqAccess::finish() {
    IgnoreVisitor ignore;
    while (next_element(ignore)) {}
}

MapAccess::MapAccess(Decoder& d, std::optional<std::uint64_t> len)
    : d_(d), remaining_(len) {}

bool MapAccess::at_end() {
    if (done_) return true;
    if (remaining_) {
        if (*remaining_ == 0) {
            done_ = true;
            return true;
        }
        return false;
    }
    if (d_.at_break()) {
        d_.consume_break();
        done_ = true;
        return true;
    }
    return false;
}

bool MapAccess::next_key(std::string& key) {
    if (value_pending_) throw CborError(ErrorKind::InvalidData, "map value was not consumed");
    if (at_end()) return false;
    if (remaining_) --*remaining_;
    key = d_.read_text();
    value_pending_ = true;
    return true;
}

bool MapAccess::next_key_any(Visitor& v) {
    if (value_pending_) throw CborError(ErrorKind::InvalidData, "map value was not consumed");
    if (at_end()) return false;
    if (remaining_) --*remaining_;
    d_.decode_any(v);
    value_pending_ = true;
    return true;
}

void MapAccess::next_value(Visitor& v) {
    if (!value_pending_) throw CborError(ErrorKind::InvalidData, "map key was not read");
    value_pending_ = false;
    d_.decode_any(v);
}

void MapAccess::finish() {
    IgnoreVisitor ignore;
    if (value_pending_) next_value(ignore);
    while (next_key_any(ignore)) {
        next_value(ignore);
    }
}

// ------------------------------
// Decoder
// ------------------------------

Decoder::Decoder(const std::uint8_t* data, std::size_t len, const DecodeOptions& opts)
    : data_(data), len_(data ? len : 0), opts_(opts) {}

Decoder::Decoder(const Bytes& buf, const DecodeOptions& opts)
    : Decoder(buf.data(), buf.size(), opts) {}

void Decoder::enter() {
    if (depth_ >= opts_.max_depth) {
        throw CborError(ErrorKind::DepthLimit, "recursion limit exceeded (max depth " + std::to_string(opts_.max_depth) + ")");
    }
    ++depth_;
}

void Decoder::leave() noexcept {
    if (depth_ > 0) --depth_;
}

Decoder::Head Decoder::parse_head(std::size_t& pos) const {
    if (pos >= len_) throw CborError(ErrorKind::Truncated, "unexpected end of input");
    const std::uint8_t ib = data_[pos++];

    Head h;
    h.major = static_cast<MajorType>(ib >> 5);
    h.info = static_cast<std::uint8_t>(ib & 0x1Fu);

    if (h.info < 24) {
        h.arg = h.info;
        return h;
    }
    if (h.info <= 27) {
        const std::size_t n = std::size_t{1} << (h.info - 24);
        if (len_ - pos < n) throw CborError(ErrorKind::Truncated, "unexpected end of input in item argument");
        std::uint64_t v = 0;
        for (std::size_t i = 0; i < n; ++i) v = (v << 8) | data_[pos++];
        h.arg = v;
        return h;
    }
    if (h.info == 31) {
        switch (h.major) {
            case MajorType::ByteString:
            case MajorType::TextString:
            case MajorType::Array:
            case MajorType::Map:
                h.indefinite = true;
                return h;
            case MajorType::Simple:
                return h; // break marker, judged by the caller
            default:
                throw CborError(ErrorKind::InvalidData, "indefinite length is not allowed for " + to_string(h.major));
        }
    }
    throw CborError(ErrorKind::InvalidData, "reserved additional information value " + std::to_string(h.info));
}

Decoder::Head Decoder::read_head() { return parse_head(pos_); }

Decoder::Head Decoder::peek_head() const {
    std::size_t pos = pos_;
    return parse_head(pos);
}

Decoder::Head Decoder::expect_head(MajorType major, const char* what) {
    Head h = read_head();
    if (h.major != major) {
        throw CborError(ErrorKind::TypeMismatch, std::string("expected ") + what + ", found " + to_string(h.major));
    }
    return h;
}

MajorType Decoder::peek_type() const { return peek_head().major; }

bool Decoder::peek_null() const {
    return pos_ < len_ && (data_[pos_] == 0xF6 || data_[pos_] == 0xF7);
}

bool Decoder::at_break() const { return pos_ < len_ && data_[pos_] == kBreak; }

void Decoder::consume_break() {
    if (!at_break()) throw CborError(ErrorKind::InvalidData, "expected break");
    ++pos_;
}

std::string Decoder::read_text_payload(const Head& h) {
    if (!h.indefinite) {
        if (h.arg > remaining()) throw CborError(ErrorKind::Truncated, "text string length exceeds input");
        const auto n = static_cast<std::size_t>(h.arg);
        const char* p = reinterpret_cast<const char*>(data_ + pos_);
        if (!is_valid_utf8(p, n)) throw CborError(ErrorKind::InvalidUtf8, "invalid UTF-8 in text string");
        pos_ += n;
        return std::string(p, n);
    }

    std::string out;
    while (!at_break()) {
        const Head c = read_head();
        if (c.major != MajorType::TextString || c.indefinite) {
            throw CborError(ErrorKind::InvalidData, "invalid chunk in indefinite-length text string");
        }
        if (c.arg > remaining()) throw CborError(ErrorKind::Truncated, "text string chunk exceeds input");
        const auto n = static_cast<std::size_t>(c.arg);
        const char* p = reinterpret_cast<const char*>(data_ + pos_);
        if (!is_valid_utf8(p, n)) throw CborError(ErrorKind::InvalidUtf8, "invalid UTF-8 in text string chunk");
        out.append(p, n);
        pos_ += n;
    }
    consume_break();
    return out;
}

Bytes Decoder::read_bytes_payload(const Head& h) {
    if (!h.indefinite) {
        if (h.arg > remaining()) throw CborError(ErrorKind::Truncated, "byte string length exceeds input");
        const auto n = static_cast<std::size_t>(h.arg);
        Bytes out(data_ + pos_, data_ + pos_ + n);
        pos_ += n;
        return out;
    }

    Bytes out;
    while (!at_break()) {
        const Head c = read_head();
        if (c.major != MajorType::ByteString || c.indefinite) {
            throw CborError(ErrorKind::InvalidData, "invalid chunk in indefinite-length byte string");
        }
        if (c.arg > remaining()) throw CborError(ErrorKind::Truncated, "byte string chunk exceeds input");
        const auto n = static_cast<std::size_t>(c.arg);
        out.insert(out.end(), data_ + pos_, data_ + pos_ + n);
        pos_ += n;
    }
    consume_break();
    return out;
}

double Decoder::float_from_head(const Head& h) const {
    switch (h.info) {
        case 25:
            return half_to_double(static_cast<std::uint16_t>(h.arg));
        case 26: {
            const auto bits = static_cast<std::uint32_t>(h.arg);
            float f = 0.0f;
            std::memcpy(&f, &bits, sizeof(f));
            return static_cast<double>(f);
        }
        case 27: {
            const std::uint64_t bits = h.arg;
            double d = 0.0;
            std::memcpy(&d, &bits, sizeof(d));
            return d;
        }
        default:
            throw CborError(ErrorKind::TypeMismatch, "expected float, found simple value");
    }
}

void Decoder::decode_any(Visitor& v) {
    const Head h = read_head();
    switch (h.major) {
        case MajorType::Unsigned:
            v.visit_u64(h.arg);
            return;

        case MajorType::Negative:
            if (h.arg <= kMaxI64) {
                v.visit_i64(-1 - static_cast<std::int64_t>(h.arg));
            } else {
                v.visit_i128(-1 - static_cast<Int128>(h.arg));
            }
            return;

        case MajorType::ByteString: {
            if (h.indefinite) {
                v.visit_byte_buf(read_bytes_payload(h));
                return;
            }
            if (h.arg > remaining()) throw CborError(ErrorKind::Truncated, "byte string length exceeds input");
            const auto n = static_cast<std::size_t>(h.arg);
            const std::uint8_t* p = data_ + pos_;
            pos_ += n;
            v.visit_bytes(p, n);
            return;
        }

        case MajorType::TextString: {
            if (h.indefinite) {
                v.visit_string(read_text_payload(h));
                return;
            }
            if (h.arg > remaining()) throw CborError(ErrorKind::Truncated, "text string length exceeds input");
            const auto n = static_cast<std::size_t>(h.arg);
            const char* p = reinterpret_cast<const char*>(data_ + pos_);
            if (!is_valid_utf8(p, n)) throw CborError(ErrorKind::InvalidUtf8, "invalid UTF-8 in text string");
            pos_ += n;
            v.visit_str(std::string_view(p, n));
            return;
        }

        case MajorType::Array: {
            NestingGuard guard(*this);
            SeqAccess seq(*this, h.indefinite ? std::nullopt : std::optional<std::uint64_t>(h.arg));
            v.visit_seq(seq);
            seq.finish();
            return;
        }

        case MajorType::Map: {
            NestingGuard guard(*this);
            MapAccess map(*this, h.indefinite ? std::nullopt : std::optional<std::uint64_t>(h.arg));
            v.visit_map(map);
            map.finish();
            return;
        }

        case MajorType::Tag: {
            NestingGuard guard(*this);
            v.visit_tagged(h.arg, *this);
            return;
        }

        case MajorType::Simple:
            switch (h.info) {
                case 20: v.visit_bool(false); return;
                case 21: v.visit_bool(true); return;
                case 22:
                case 23: v.visit_null(); return;
                case 25:
                case 26:
                case 27: v.visit_f64(float_from_head(h)); return;
                case 31: throw CborError(ErrorKind::InvalidData, "unexpected break");
                default:
                    throw CborError(ErrorKind::InvalidData,
                                    "unsupported simple value " + std::to_string(h.info < 24 ? h.info : h.arg));
            }
    }
    throw CborError(ErrorKind::InvalidData, "unknown major type");
}

void Decoder::read_null() {
    const Head h = read_head();
    if (h.major != MajorType::Simple || (h.info != 22 && h.info != 23)) {
        throw CborError(ErrorKind::TypeMismatch, "expected null, found " + to_string(h.major));
    }
}

bool Decoder::read_bool() {
    const Head h = read_head();
    if (h.major == MajorType::Simple && h.info == 20) return false;
    if (h.major == MajorType::Simple && h.info == 21) return true;
    throw CborError(ErrorKind::TypeMismatch, "expected bool, found " + to_string(h.major));
}

std::uint64_t Decoder::read_u64() {
    const Head h = read_head();
    if (h.major == MajorType::Unsigned) return h.arg;
    if (h.major == MajorType::Negative) {
        throw CborError(ErrorKind::OutOfRange, "negative integer where unsigned was expected");
    }
    throw CborError(ErrorKind::TypeMismatch, "expected integer, found " + to_string(h.major));
}

std::int64_t Decoder::read_i64() {
    const Head h = read_head();
    if (h.major == MajorType::Unsigned) {
        if (h.arg > kMaxI64) throw CborError(ErrorKind::OutOfRange, "integer out of range for i64");
        return static_cast<std::int64_t>(h.arg);
    }
    if (h.major == MajorType::Negative) {
        if (h.arg > kMaxI64) throw CborError(ErrorKind::OutOfRange, "integer out of range for i64");
        return -1 - static_cast<std::int64_t>(h.arg);
    }
    throw CborError(ErrorKind::TypeMismatch, "expected integer, found " + to_string(h.major));
}

Int128 Decoder::read_int() {
    const Head h = read_head();
    if (h.major == MajorType::Unsigned) return static_cast<Int128>(h.arg);
    if (h.major == MajorType::Negative) return -1 - static_cast<Int128>(h.arg);
    throw CborError(ErrorKind::TypeMismatch, "expected integer, found " + to_string(h.major));
}

double Decoder::read_f64() {
    const Head h = read_head();
    if (h.major != MajorType::Simple) {
        throw CborError(ErrorKind::TypeMismatch, "expected float, found " + to_string(h.major));
    }
    return float_from_head(h);
}

std::string Decoder::read_text() {
    const Head h = expect_head(MajorType::TextString, "text string");
    return read_text_payload(h);
}

Bytes Decoder::read_bytes() {
    const Head h = expect_head(MajorType::ByteString, "byte string");
    return read_bytes_payload(h);
}

std::uint64_t Decoder::read_tag() {
    return expect_head(MajorType::Tag, "tag").arg;
}

TaggedBytes Decoder::read_tagged_bytes() {
    TaggedBytes out;
    Head h = read_head();
    if (h.major == MajorType::Tag) {
        out.tag = h.arg;
        h = read_head();
    }
    if (h.major != MajorType::ByteString) {
        throw CborError(ErrorKind::TypeMismatch, "expected byte string, found " + to_string(h.major));
    }
    out.bytes = read_bytes_payload(h);
    return out;
}

std::optional<std::uint64_t> Decoder::read_array_header() {
    const Head h = expect_head(MajorType::Array, "array");
    if (h.indefinite) return std::nullopt;
    return h.arg;
}

std::optional<std::uint64_t> Decoder::read_map_header() {
    const Head h = expect_head(MajorType::Map, "map");
    if (h.indefinite) return std::nullopt;
    return h.arg;
}

void Decoder::skip() {
    IgnoreVisitor ignore;
    decode_any(ignore);
}

void Decoder::finish() const {
    if (!opts_.allow_trailing && pos_ != len_) {
        throw CborError(ErrorKind::TrailingData,
                        "trailing data after top-level item (" + std::to_string(len_ - pos_) + " bytes)");
    }
}

} // namespace ipld

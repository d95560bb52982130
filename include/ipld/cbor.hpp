#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ipld {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    Io,
    Truncated,
    InvalidData,
    InvalidUtf8,
    TrailingData,
    DepthLimit,
    TypeMismatch,
    MissingField,
    OutOfRange,
    UnexpectedTag,
    TagPolicy,
    ZlibError,
};

std::string to_string(ErrorKind k);

class CborError : public std::runtime_error {
public:
    CborError(ErrorKind k, const std::string& msg);
    ErrorKind kind() const noexcept;

private:
    ErrorKind kind_;
};

// ------------------------------
// Wire primitives
// ------------------------------

using Bytes = std::vector<std::uint8_t>;

// Wide enough for every integer CBOR can carry (-2^64 .. 2^64-1).
using Int128 = __int128;

// Tag number reserved for content-addressed links.
constexpr std::uint64_t kCidTag = 42;

enum class MajorType : std::uint8_t {
    Unsigned = 0,
    Negative = 1,
    ByteString = 2,
    TextString = 3,
    Array = 4,
    Map = 5,
    Tag = 6,
    Simple = 7,
};

std::string to_string(MajorType t);

struct DecodeOptions {
    std::size_t max_depth{128};
    bool allow_trailing{false}; // accept bytes after the top-level item
};

// ------------------------------
// Encoder
// ------------------------------

class Encoder {
public:
    void write_null();
    void write_bool(bool v);
    void write_u64(std::uint64_t v);
    void write_i64(std::int64_t v);
    /// Throws OutOfRange outside -2^64 .. 2^64-1.
    void write_i128(Int128 v);
    /// Shortest of half/single/double that represents `v` exactly.
    void write_f64(double v);
    void write_text(std::string_view s);
    void write_bytes(const std::uint8_t* data, std::size_t len);
    void write_bytes(const Bytes& b);
    void write_tag(std::uint64_t tag);
    /// Tag followed by its byte string payload, emitted as one unit.
    void write_tagged_bytes(std::uint64_t tag, const std::uint8_t* data, std::size_t len);

    void begin_array(std::uint64_t n);
    void begin_map(std::uint64_t n);
    void begin_indefinite_array();
    void begin_indefinite_map();
    void write_break();

    const Bytes& bytes() const noexcept { return out_; }
    Bytes take();

private:
    void write_head(MajorType major, std::uint64_t arg);

    Bytes out_;
};

// ------------------------------
// Decoder and visitor protocol
// ------------------------------

class Decoder;

class Visitor;

/// Element access handed to Visitor::visit_seq.
class SeqAccess {
public:
    SeqAccess(Decoder& d, std::optional<std::uint64_t> len);

    /// Decodes the next element into `v`; false at end of sequence.
    bool next_element(Visitor& v);
    std::optional<std::uint64_t> size_hint() const noexcept { return remaining_; }
    void finish();

private:
    Decoder& d_;
    std::optional<std::uint64_t> remaining_;
    bool done_{false};
};

/// Entry access handed to Visitor::visit_map.
class MapAccess {
public:
    MapAccess(Decoder& d, std::optional<std::uint64_t> len);

    /// Reads the next key, which must be a text string; false at end of map.
    bool next_key(std::string& key);
    /// Feeds the next key of any type to `v`; false at end of map.
    bool next_key_any(Visitor& v);
    void next_value(Visitor& v);
    std::optional<std::uint64_t> size_hint() const noexcept { return remaining_; }
    void finish();

private:
    bool at_end();

    Decoder& d_;
    std::optional<std::uint64_t> remaining_;
    bool done_{false};
    bool value_pending_{false};
};

/// One callback per decode event. The decoder fires exactly one of these
/// per item; containers and tags hand back access to the nested items.
class Visitor {
public:
    virtual ~Visitor() = default;

    // null and undefined
    virtual void visit_null() = 0;
    virtual void visit_bool(bool v) = 0;
    virtual void visit_u64(std::uint64_t v) = 0;
    virtual void visit_i64(std::int64_t v) = 0;
    // negative integers below INT64_MIN
    virtual void visit_i128(Int128 v) = 0;
    virtual void visit_f64(double v) = 0;
    // borrowed from the input buffer, valid only during the call
    virtual void visit_str(std::string_view v) = 0;
    // assembled from indefinite-length chunks
    virtual void visit_string(std::string v) = 0;
    virtual void visit_bytes(const std::uint8_t* data, std::size_t len) = 0;
    virtual void visit_byte_buf(Bytes v) = 0;
    virtual void visit_seq(SeqAccess& seq) = 0;
    virtual void visit_map(MapAccess& map) = 0;
    /// `tag` is the innermost tag wrapping the item `payload` will decode next.
    virtual void visit_tagged(std::optional<std::uint64_t> tag, Decoder& payload) = 0;
};

struct TaggedBytes {
    std::optional<std::uint64_t> tag;
    Bytes bytes;
};

class Decoder {
public:
    Decoder(const std::uint8_t* data, std::size_t len, const DecodeOptions& opts = DecodeOptions{});
    explicit Decoder(const Bytes& buf, const DecodeOptions& opts = DecodeOptions{});

    /// Parse one item and fire the matching event on `v`.
    void decode_any(Visitor& v);

    MajorType peek_type() const;
    bool peek_null() const;
    bool at_end() const noexcept { return pos_ >= len_; }
    bool at_break() const;
    void consume_break();

    void read_null();
    bool read_bool();
    std::uint64_t read_u64();
    std::int64_t read_i64();
    Int128 read_int();
    double read_f64();
    std::string read_text();
    Bytes read_bytes();
    std::uint64_t read_tag();
    /// One byte string with at most one tag in front of it.
    TaggedBytes read_tagged_bytes();

    /// nullopt for indefinite length.
    std::optional<std::uint64_t> read_array_header();
    std::optional<std::uint64_t> read_map_header();

    void skip();
    /// Throws TrailingData if bytes remain and the options do not allow it.
    void finish() const;

    std::size_t position() const noexcept { return pos_; }
    std::size_t remaining() const noexcept { return len_ - pos_; }
    std::size_t depth() const noexcept { return depth_; }
    const DecodeOptions& options() const noexcept { return opts_; }

    void enter();
    void leave() noexcept;

private:
    struct Head {
        MajorType major{MajorType::Unsigned};
        std::uint8_t info{0};
        std::uint64_t arg{0};
        bool indefinite{false};
    };

    Head read_head();
    Head peek_head() const;
    Head parse_head(std::size_t& pos) const;
    Head expect_head(MajorType major, const char* what);

    std::string read_text_payload(const Head& h);
    Bytes read_bytes_payload(const Head& h);
    double float_from_head(const Head& h) const;

    const std::uint8_t* data_{nullptr};
    std::size_t len_{0};
    std::size_t pos_{0};
    std::size_t depth_{0};
    DecodeOptions opts_{};
};

/// Scoped nesting level on a Decoder; enforces DecodeOptions::max_depth.
class NestingGuard {
public:
    explicit NestingGuard(Decoder& d) : d_(d) { d_.enter(); }
    ~NestingGuard() { d_.leave(); }
    NestingGuard(const NestingGuard&) = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;

private:
    Decoder& d_;
};

// ------------------------------
// Utilities
// ------------------------------

double half_to_double(std::uint16_t half);
std::string to_string(Int128 v);
bool is_valid_utf8(const char* s, std::size_t len) noexcept;

} // namespace ipld

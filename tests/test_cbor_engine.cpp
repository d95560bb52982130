#include "ipld/cbor.hpp"
#include "ipld/ipld_easy.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::ostringstream _oss; \
        _oss << "CHECK failed: " #cond " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

using ipld::easy::bytes_from_hex;
using ipld::easy::to_hex;

template <typename F>
static ipld::CborError expect_error(F&& fn) {
    try {
        fn();
    } catch (const ipld::CborError& e) {
        return e;
    }
    throw std::runtime_error("expected a CborError");
}

// Writes one line per event, descending into containers and tags.
class RecordingVisitor final : public ipld::Visitor {
public:
    std::vector<std::string> events;

    void visit_null() override { events.push_back("null"); }
    void visit_bool(bool v) override { events.push_back(v ? "true" : "false"); }
    void visit_u64(std::uint64_t v) override { events.push_back("u64:" + std::to_string(v)); }
    void visit_i64(std::int64_t v) override { events.push_back("i64:" + std::to_string(v)); }
    void visit_i128(ipld::Int128 v) override { events.push_back("i128:" + ipld::to_string(v)); }
    void visit_f64(double v) override {
        std::ostringstream oss;
        oss << "f64:" << v;
        events.push_back(oss.str());
    }
    void visit_str(std::string_view v) override { events.push_back("str:" + std::string(v)); }
    void visit_string(std::string v) override { events.push_back("string:" + v); }
    void visit_bytes(const std::uint8_t*, std::size_t len) override { events.push_back("bytes:" + std::to_string(len)); }
    void visit_byte_buf(ipld::Bytes v) override { events.push_back("bytebuf:" + std::to_string(v.size())); }

    void visit_seq(ipld::SeqAccess& seq) override {
        events.push_back("seq:" + hint(seq.size_hint()));
        if (!descend) return;
        while (seq.next_element(*this)) {}
    }

    void visit_map(ipld::MapAccess& map) override {
        events.push_back("map:" + hint(map.size_hint()));
        if (!descend) return;
        while (map.next_key_any(*this)) {
            map.next_value(*this);
        }
    }

    void visit_tagged(std::optional<std::uint64_t> tag, ipld::Decoder& payload) override {
        events.push_back("tag:" + (tag ? std::to_string(*tag) : std::string("none")));
        payload.decode_any(*this);
    }

    bool descend{true};

private:
    static std::string hint(std::optional<std::uint64_t> n) {
        return n ? std::to_string(*n) : std::string("?");
    }
};

static std::vector<std::string> events_of(const std::string& hex) {
    const ipld::Bytes buf = bytes_from_hex(hex);
    ipld::Decoder d(buf);
    RecordingVisitor v;
    d.decode_any(v);
    d.finish();
    return v.events;
}

static std::string nested_arrays(std::size_t depth) {
    std::string hex;
    for (std::size_t i = 0; i < depth; ++i) hex += "81";
    return hex + "01";
}

int main() {
    // Minimal-length heads
    {
        auto u = [](std::uint64_t v) {
            ipld::Encoder e;
            e.write_u64(v);
            return to_hex(e.bytes());
        };
        CHECK(u(0) == "00");
        CHECK(u(23) == "17");
        CHECK(u(24) == "1818");
        CHECK(u(255) == "18FF");
        CHECK(u(256) == "190100");
        CHECK(u(65535) == "19FFFF");
        CHECK(u(65536) == "1A00010000");
        CHECK(u(0xFFFFFFFFull) == "1AFFFFFFFF");
        CHECK(u(0x100000000ull) == "1B0000000100000000");
        CHECK(u(std::numeric_limits<std::uint64_t>::max()) == "1BFFFFFFFFFFFFFFFF");

        auto i = [](std::int64_t v) {
            ipld::Encoder e;
            e.write_i64(v);
            return to_hex(e.bytes());
        };
        CHECK(i(10) == "0A");
        CHECK(i(-1) == "20");
        CHECK(i(-24) == "37");
        CHECK(i(-25) == "3818");
        CHECK(i(-257) == "390100");
        CHECK(i(std::numeric_limits<std::int64_t>::min()) == "3B7FFFFFFFFFFFFFFF");
    }

    // i128 range is exactly -2^64 .. 2^64-1
    {
        const ipld::Int128 two64 = static_cast<ipld::Int128>(1) << 64;

        ipld::Encoder e;
        e.write_i128(-two64);
        CHECK(to_hex(e.bytes()) == "3BFFFFFFFFFFFFFFFF");

        ipld::Encoder e2;
        e2.write_i128(two64 - 1);
        CHECK(to_hex(e2.bytes()) == "1BFFFFFFFFFFFFFFFF");

        auto err = expect_error([&] { ipld::Encoder x; x.write_i128(two64); });
        CHECK(err.kind() == ipld::ErrorKind::OutOfRange);
        err = expect_error([&] { ipld::Encoder x; x.write_i128(-two64 - 1); });
        CHECK(err.kind() == ipld::ErrorKind::OutOfRange);

        CHECK(ipld::to_string(-two64) == "-18446744073709551616");
        CHECK(ipld::to_string(ipld::Int128{0}) == "0");
    }

    // Shortest exact float encoding
    {
        auto f = [](double v) {
            ipld::Encoder e;
            e.write_f64(v);
            return to_hex(e.bytes());
        };
        CHECK(f(0.0) == "F90000");
        CHECK(f(-0.0) == "F98000");
        CHECK(f(1.0) == "F93C00");
        CHECK(f(0.5) == "F93800");
        CHECK(f(-2.0) == "F9C000");
        CHECK(f(65504.0) == "F97BFF");
        CHECK(f(std::ldexp(1.0, -24)) == "F90001");
        CHECK(f(std::numeric_limits<double>::infinity()) == "F97C00");
        CHECK(f(-std::numeric_limits<double>::infinity()) == "F9FC00");
        CHECK(f(100000.0) == "FA47C35000");
        CHECK(f(1.1) == "FB3FF199999999999A");

        const std::string nan = f(std::numeric_limits<double>::quiet_NaN());
        CHECK(nan.size() == 18);
        CHECK(nan.rfind("FB", 0) == 0);
    }

    // Float decoding widens to double
    {
        auto rd = [](const std::string& hex) {
            const ipld::Bytes buf = bytes_from_hex(hex);
            ipld::Decoder d(buf);
            double v = d.read_f64();
            d.finish();
            return v;
        };
        CHECK(rd("F93C00") == 1.0);
        CHECK(rd("F97BFF") == 65504.0);
        CHECK(rd("F90001") == std::ldexp(1.0, -24));
        CHECK(rd("FA47C35000") == 100000.0);
        CHECK(rd("FB3FF199999999999A") == 1.1);
        CHECK(std::isnan(rd("F97E00")));
        CHECK(std::isinf(rd("F9FC00")) && rd("F9FC00") < 0);
        CHECK(ipld::half_to_double(0x3555) > 0.333 && ipld::half_to_double(0x3555) < 0.334);
    }

    // Strings, tags, containers
    {
        ipld::Encoder e;
        e.begin_array(4);
        e.write_text("IETF");
        e.write_bytes(ipld::Bytes{1, 2, 3, 4});
        e.write_tagged_bytes(ipld::kCidTag, nullptr, 0);
        e.begin_map(1);
        e.write_text("a");
        e.write_null();
        CHECK(to_hex(e.bytes()) == "8464494554464401020304D82A40A16161F6");

        ipld::Encoder ind;
        ind.begin_indefinite_array();
        ind.write_bool(true);
        ind.write_bool(false);
        ind.write_break();
        ind.begin_indefinite_map();
        ind.write_break();
        CHECK(to_hex(ind.take()) == "9FF5F4FFBFFF");
        CHECK(ind.bytes().empty());
    }

    // Event stream: borrowed vs. owned strings, integer widths
    {
        CHECK(events_of("6449455446") == std::vector<std::string>{"str:IETF"});
        CHECK(events_of("7F626865616CFF") == std::vector<std::string>{"string:hel"});
        CHECK(events_of("43010203") == std::vector<std::string>{"bytes:3"});
        CHECK(events_of("5F4201024103FF") == std::vector<std::string>{"bytebuf:3"});
        CHECK(events_of("1BFFFFFFFFFFFFFFFF") == std::vector<std::string>{"u64:18446744073709551615"});
        CHECK(events_of("3B7FFFFFFFFFFFFFFF") == std::vector<std::string>{"i64:-9223372036854775808"});
        CHECK(events_of("3B8000000000000000") == std::vector<std::string>{"i128:-9223372036854775809"});
        CHECK(events_of("3BFFFFFFFFFFFFFFFF") == std::vector<std::string>{"i128:-18446744073709551616"});
        CHECK(events_of("F6") == std::vector<std::string>{"null"});
        CHECK(events_of("F7") == std::vector<std::string>{"null"});
        CHECK(events_of("F5") == std::vector<std::string>{"true"});

        std::vector<std::string> want = {"seq:2", "u64:1", "map:1", "str:a", "tag:42", "bytes:1"};
        CHECK(events_of("8201A16161D82A4107") == want);

        want = {"seq:?", "u64:1", "seq:0"};
        CHECK(events_of("9F0180FF") == want);
    }

    // A visitor that ignores container contents still leaves the cursor past the item
    {
        const ipld::Bytes buf = bytes_from_hex("82A16161018203040A");
        ipld::Decoder d(buf, ipld::DecodeOptions{128, true});
        RecordingVisitor v;
        v.descend = false;
        d.decode_any(v);
        CHECK(v.events == std::vector<std::string>{"seq:2"});
        CHECK(d.remaining() == 1);
        CHECK(d.read_u64() == 10);
        CHECK(d.at_end());
        CHECK(d.depth() == 0);
    }

    // Typed reads
    {
        const ipld::Bytes buf = bytes_from_hex("9F6161A1616202FFD82A4107D863420809");
        ipld::Decoder d(buf);
        CHECK(d.peek_type() == ipld::MajorType::Array);
        CHECK(!d.read_array_header().has_value());
        CHECK(d.read_text() == "a");
        auto n = d.read_map_header();
        CHECK(n.has_value() && *n == 1);
        CHECK(d.read_text() == "b");
        CHECK(d.read_u64() == 2);
        CHECK(d.at_break());
        d.consume_break();

        ipld::TaggedBytes t = d.read_tagged_bytes();
        CHECK(t.tag.has_value() && *t.tag == 42);
        CHECK(t.bytes == ipld::Bytes{7});

        CHECK(d.read_tag() == 99);
        CHECK(d.read_bytes() == (ipld::Bytes{8, 9}));
        d.finish();
    }

    // Typed read failures
    {
        auto err = expect_error([] {
            const ipld::Bytes buf = bytes_from_hex("01");
            ipld::Decoder d(buf);
            (void)d.read_text();
        });
        CHECK(err.kind() == ipld::ErrorKind::TypeMismatch);
        CHECK(std::string(err.what()) == "expected text string, found unsigned integer");

        err = expect_error([] {
            const ipld::Bytes buf = bytes_from_hex("1B8000000000000000");
            ipld::Decoder d(buf);
            (void)d.read_i64();
        });
        CHECK(err.kind() == ipld::ErrorKind::OutOfRange);

        err = expect_error([] {
            const ipld::Bytes buf = bytes_from_hex("20");
            ipld::Decoder d(buf);
            (void)d.read_u64();
        });
        CHECK(err.kind() == ipld::ErrorKind::OutOfRange);

        err = expect_error([] {
            const ipld::Bytes buf = bytes_from_hex("F5");
            ipld::Decoder d(buf);
            d.read_null();
        });
        CHECK(err.kind() == ipld::ErrorKind::TypeMismatch);
    }

    // Malformed input
    {
        struct Case {
            const char* hex;
            ipld::ErrorKind kind;
        };
        const std::vector<Case> cases = {
            {"", ipld::ErrorKind::Truncated},
            {"18", ipld::ErrorKind::Truncated},
            {"1A0000", ipld::ErrorKind::Truncated},
            {"430102", ipld::ErrorKind::Truncated},
            {"810101", ipld::ErrorKind::TrailingData},
            {"8201", ipld::ErrorKind::Truncated},
            {"1C", ipld::ErrorKind::InvalidData},
            {"1F", ipld::ErrorKind::InvalidData},
            {"DF", ipld::ErrorKind::InvalidData},
            {"FF", ipld::ErrorKind::InvalidData},
            {"F820", ipld::ErrorKind::InvalidData},
            {"5F6161FF", ipld::ErrorKind::InvalidData},
            {"62C328", ipld::ErrorKind::InvalidUtf8},
            {"62C080", ipld::ErrorKind::InvalidUtf8},
            {"63EDA080", ipld::ErrorKind::InvalidUtf8},
            {"0101", ipld::ErrorKind::TrailingData},
        };
        for (const auto& c : cases) {
            auto err = expect_error([&] { (void)events_of(c.hex); });
            if (err.kind() != c.kind) {
                std::cerr << "case " << c.hex << ": " << err.what() << "\n";
            }
            CHECK(err.kind() == c.kind);
        }

        auto err = expect_error([] { (void)events_of("FF"); });
        CHECK(std::string(err.what()) == "unexpected break");
        err = expect_error([] { (void)events_of("0101"); });
        CHECK(std::string(err.what()) == "trailing data after top-level item (1 bytes)");
    }

    // Trailing bytes are allowed on request
    {
        const ipld::Bytes buf = bytes_from_hex("0102");
        ipld::DecodeOptions opts;
        opts.allow_trailing = true;
        ipld::Decoder d(buf, opts);
        CHECK(d.read_u64() == 1);
        d.finish();
        CHECK(d.position() == 1);
    }

    // Nesting limit
    {
        const ipld::Bytes ok = bytes_from_hex(nested_arrays(128));
        ipld::Decoder d(ok);
        d.skip();
        d.finish();

        const ipld::Bytes deep = bytes_from_hex(nested_arrays(129));
        auto err = expect_error([&] {
            ipld::Decoder dd(deep);
            dd.skip();
        });
        CHECK(err.kind() == ipld::ErrorKind::DepthLimit);
        CHECK(std::string(err.what()) == "recursion limit exceeded (max depth 128)");

        ipld::DecodeOptions shallow;
        shallow.max_depth = 2;
        const ipld::Bytes two = bytes_from_hex("818101");
        ipld::Decoder d2(two, shallow);
        d2.skip();
        const ipld::Bytes three = bytes_from_hex("81818101");
        err = expect_error([&] {
            ipld::Decoder d3(three, shallow);
            d3.skip();
        });
        CHECK(err.kind() == ipld::ErrorKind::DepthLimit);
    }

    // UTF-8 validator
    {
        const std::string good = "caff\xC3\xA8 \xE2\x82\xAC \xF0\x9F\x98\x80";
        CHECK(ipld::is_valid_utf8(good.data(), good.size()));
        const std::string above_max = "\xF4\x90\x80\x80";
        CHECK(!ipld::is_valid_utf8(above_max.data(), above_max.size()));
        const std::string cut = "\xE2\x82";
        CHECK(!ipld::is_valid_utf8(cut.data(), cut.size()));
    }

    std::cout << "All tests passed.\n";
    return 0;
}

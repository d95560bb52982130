#include "ipld/cid.hpp"

#include <utility>

namespace ipld {

bool operator==(const Cid& a, const Cid& b) noexcept { return a.bytes == b.bytes; }

bool operator!=(const Cid& a, const Cid& b) noexcept { return !(a == b); }

void encode(Encoder& e, const Cid& cid) {
    e.write_tagged_bytes(kCidTag, cid.bytes.data(), cid.bytes.size());
}

void decode(Decoder& d, Cid& out) {
    TaggedBytes tagged = d.read_tagged_bytes();
    // Untagged input shows up when a link was re-encoded by a writer that
    // drops tags.
    if (tagged.tag && *tagged.tag != kCidTag) {
        throw CborError(ErrorKind::UnexpectedTag, "unexpected tag");
    }
    out.bytes = std::move(tagged.bytes);
}

} // namespace ipld

#pragma once

#include "ipld/cbor.hpp"

namespace ipld {

/// Content identifier. The bytes are opaque; no multihash or multicodec
/// structure is checked.
struct Cid {
    Bytes bytes{};
};

bool operator==(const Cid& a, const Cid& b) noexcept;
bool operator!=(const Cid& a, const Cid& b) noexcept;

/// Writes tag 42 followed by the link bytes as a byte string.
void encode(Encoder& e, const Cid& cid);

/// Accepts a byte string tagged 42 or carrying no tag at all. Any other tag
/// raises UnexpectedTag.
void decode(Decoder& d, Cid& out);

} // namespace ipld

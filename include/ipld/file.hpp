#pragma once

#include "ipld/cbor.hpp"
#include "ipld/value.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <utility>

namespace ipld {

// ------------------------------
// Block files
// ------------------------------

// Upper bound for a block after inflation.
constexpr std::uint64_t kMaxBlockSize = 256ull * 1024ull * 1024ull;

enum class CompressionMode {
    Never,
    Always,
    Auto,
};

struct ReadOptions {
    // Auto: inflate when the file starts with a zlib header; a stream that
    // fails to inflate is read as stored only if it is one well-formed item.
    CompressionMode compression{CompressionMode::Auto};
    DecodeOptions decode{};
};

struct WriteOptions {
    // Auto keeps the zlib stream only when it is smaller.
    CompressionMode compression{CompressionMode::Never};
    int zlib_level{6}; // 0..9
};

struct BlockInfo {
    std::uint64_t file_size{0};
    bool compressed{false};
    std::uint32_t crc32{0}; // of the uncompressed block
};

Bytes read_block(const std::filesystem::path& file, const ReadOptions& opts = ReadOptions{});

/// Like read_block, also reporting how the block was stored.
std::pair<Bytes, BlockInfo> read_block_with_info(
    const std::filesystem::path& file,
    const ReadOptions& opts = ReadOptions{}
);

void write_block(
    const std::filesystem::path& file,
    const Bytes& block,
    const WriteOptions& opts = WriteOptions{}
);

Value read_value_file(const std::filesystem::path& file, const ReadOptions& opts = ReadOptions{});

void write_value_file(
    const std::filesystem::path& file,
    const Value& root,
    const WriteOptions& opts = WriteOptions{}
);

// ------------------------------
// Utilities
// ------------------------------

std::uint32_t crc32_bytes(const std::uint8_t* data, std::size_t len);

/// True when the first two bytes form a valid zlib stream header.
bool looks_like_zlib(const std::uint8_t* data, std::size_t len) noexcept;

Bytes zlib_compress(const Bytes& in, int level);
Bytes zlib_inflate(const std::uint8_t* data, std::size_t len, std::uint64_t max_size = kMaxBlockSize);

} // namespace ipld

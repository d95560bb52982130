#include "ipld/codec.hpp"
#include "ipld/file.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

static double ms_since(const std::chrono::high_resolution_clock::time_point& t0) {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(high_resolution_clock::now() - t0).count();
}

// A list of small records, each with a link, mixed scalars and a blob.
static ipld::Value make_payload(std::size_t records) {
    std::mt19937_64 rng(123);
    std::uniform_real_distribution<double> dist(0.0, 1.0);

    ipld::Value::List items;
    items.reserve(records);
    for (std::size_t i = 0; i < records; ++i) {
        ipld::Bytes cid(36);
        for (auto& b : cid) b = static_cast<std::uint8_t>(rng());
        ipld::Bytes blob(64);
        for (auto& b : blob) b = static_cast<std::uint8_t>(rng() & 0x0F);

        ipld::Value::Map m;
        m.emplace("id", ipld::Value::make_integer(static_cast<ipld::Int128>(i)));
        m.emplace("name", ipld::Value::make_string("record-" + std::to_string(i)));
        m.emplace("score", ipld::Value::make_float(dist(rng)));
        m.emplace("active", ipld::Value::make_bool(i % 3 != 0));
        m.emplace("parent", ipld::Value::make_link(ipld::Cid{std::move(cid)}));
        m.emplace("blob", ipld::Value::make_bytes(std::move(blob)));
        items.push_back(ipld::Value::make_map(std::move(m)));
    }
    return ipld::Value::make_list(std::move(items));
}

static void bench_codec(const ipld::Value& root) {
    std::cout << "=== codec ===\n";

    auto t0 = std::chrono::high_resolution_clock::now();
    ipld::Bytes block = ipld::encode(root);
    double e_ms = ms_since(t0);
    double mb = static_cast<double>(block.size()) / (1024.0 * 1024.0);
    std::cout << "encode: " << e_ms << " ms, block=" << mb << " MiB, throughput=" << (mb / (e_ms / 1000.0)) << " MiB/s\n";

    t0 = std::chrono::high_resolution_clock::now();
    ipld::Value back = ipld::decode_as_value(block);
    double d_ms = ms_since(t0);
    std::cout << "decode: " << d_ms << " ms, throughput=" << (mb / (d_ms / 1000.0)) << " MiB/s\n";

    if (back != root) std::cout << "warning: decoded value differs\n";
}

static void bench_file(const std::filesystem::path& file, const ipld::Value& root, ipld::CompressionMode comp) {
    ipld::WriteOptions wo;
    wo.compression = comp;
    wo.zlib_level = 6;

    std::cout << "=== " << (comp == ipld::CompressionMode::Never ? "compression=none" :
                             comp == ipld::CompressionMode::Always ? "compression=zlib" : "compression=auto")
              << " ===\n";

    auto t0 = std::chrono::high_resolution_clock::now();
    ipld::write_value_file(file, root, wo);
    double w_ms = ms_since(t0);

    std::uintmax_t sz = std::filesystem::file_size(file);
    double mb = static_cast<double>(sz) / (1024.0 * 1024.0);

    std::cout << "write: " << w_ms << " ms, file=" << mb << " MiB, throughput=" << (mb / (w_ms / 1000.0)) << " MiB/s\n";

    t0 = std::chrono::high_resolution_clock::now();
    ipld::Value read = ipld::read_value_file(file);
    double r_ms = ms_since(t0);
    std::cout << "read : " << r_ms << " ms, throughput=" << (mb / (r_ms / 1000.0)) << " MiB/s\n";
    if (!(read == root)) throw std::runtime_error("file round-trip mismatch");
}

int main(int argc, char** argv) {
    std::filesystem::path file = (argc >= 2) ? argv[1] : (std::filesystem::temp_directory_path() / "ipld_cpp_bench.cbor");
    try {
        ipld::Value root = make_payload(100000);
        bench_codec(root);
        bench_file(file, root, ipld::CompressionMode::Never);
        bench_file(file, root, ipld::CompressionMode::Always);
        bench_file(file, root, ipld::CompressionMode::Auto);
    } catch (const std::exception& e) {
        std::cerr << "bench error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

#include "ipld/codec.hpp"
#include "ipld/file.hpp"
#include "ipld/ipld_easy.hpp"

#include <iostream>
#include <string>

namespace demo {

struct Contact {
    std::string name;
    ipld::Cid details;
};

void encode(ipld::Encoder& e, const Contact& c) {
    e.begin_map(2);
    e.write_text("name");
    encode(e, c.name);
    e.write_text("details");
    encode(e, c.details);
}

void decode(ipld::Decoder& d, Contact& out) {
    bool have_name = false;
    bool have_details = false;
    ipld::decode_record(d, [&](const std::string& key, ipld::Decoder& fd) {
        if (key == "name") {
            decode(fd, out.name);
            have_name = true;
            return true;
        }
        if (key == "details") {
            decode(fd, out.details);
            have_details = true;
            return true;
        }
        return false;
    });
    ipld::require_field(have_name, "name");
    ipld::require_field(have_details, "details");
}

} // namespace demo

int main() {
    try {
        using namespace ipld;

        demo::Contact contact{"Hello World!", Cid{{7, 8, 9}}};

        Bytes block = encode(contact);
        std::cout << "Encoded " << block.size() << " bytes: " << easy::to_hex(block) << "\n";

        demo::Contact back = decode_as<demo::Contact>(block);
        std::cout << "As Contact: name=" << back.name
                  << " details=" << easy::to_hex(back.details.bytes) << "\n";

        Value generic = decode_as_value(block);
        std::cout << "As Value: " << generic << "\n";

        // Write
        WriteOptions wo;
        wo.compression = CompressionMode::Auto;
        wo.zlib_level = 6;

        std::string file = "demo_out.cbor";
        write_value_file(file, generic, wo);

        std::cout << "Wrote: " << file << "\n";

        // Read back
        Value read_root = read_value_file(file);
        const Value::Map& m = read_root.as_map();
        std::cout << "Read details: kind=" << to_string(m.at("details").kind())
                  << " link=" << easy::to_hex(m.at("details").as_link().bytes) << "\n";

        std::cout << (read_root == generic ? "OK\n" : "MISMATCH\n");
        return read_root == generic ? 0 : 1;

    } catch (const ipld::CborError& e) {
        std::cerr << "CBOR error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

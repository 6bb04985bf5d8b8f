/**
 * @file tlv_stream_example.cpp
 * @brief Example: building, encoding and decoding extensible messages
 *
 * Usage: tlv_stream_example [config-file]
 */

#include <iostream>
#include <string>
#include <variant>
#include "../src/core/include/lnp_config.hpp"
#include "../src/core/include/lnp_hex.hpp"
#include "../src/core/include/lnp_request.hpp"
#include "../src/core/include/lnp_strict_encoding.hpp"

using namespace lnp;

namespace {

void print_result(const char* label, const Status& s) {
    std::cout << "   " << label << ": " << s.to_string() << "\n";
}

} // namespace

int main(int argc, char** argv) {
    Config& cfg = Config::instance();
    if (argc > 1 && !cfg.loadFromFile(argv[1])) {
        std::cerr << "cannot read config " << argv[1] << "\n";
        return 1;
    }
    if (!apply_logging_config(cfg)) {
        std::cerr << "log file unavailable, logging to console only\n";
    }

    RequestCodec codec(DecodeOptions::from_config(cfg));

    std::cout << "=== LNP presentation layer example ===\n\n";

    // Example 1: fixed messages
    std::cout << "1. Fixed-layout messages\n";
    std::cout << "   Hello(\"world\") -> " << to_hex(RequestCodec::encode(Hello("world"))) << "\n";
    std::cout << "   Empty          -> " << to_hex(RequestCodec::encode(Empty())) << "\n";
    std::cout << "   NoArgs         -> " << to_hex(RequestCodec::encode(NoArgs())) << "\n\n";

    // Example 2: Init with a TLV extension stream
    std::cout << "2. Init with extensions\n";
    ChainHash regtest{};
    regtest.fill(0x06);

    Init init;
    init.features = {0x02, 0x0a};
    init.set_networks({regtest});
    init.tlvs.insert(Init::REMOTE_ADDRESS, {0x7f, 0x00, 0x00, 0x01, 0x26, 0x07});
    init.tlvs.insert(Type(101), {0x01});   // odd: a newer peer's optional field

    auto wire = RequestCodec::encode(init);
    std::cout << "   encoded " << wire.size() << " bytes: " << hex_preview(wire.data(), wire.size()) << "\n";

    auto decoded = codec.decode(wire);
    print_result("decode", decoded.status());
    if (decoded) {
        const Init& msg = std::get<Init>(decoded.value());
        std::cout << "   records: " << msg.tlvs.size()
                  << ", networks: " << msg.networks().size() << "\n";
        for (const auto& [type, value] : msg.tlvs) {
            std::cout << "     type " << type << " (" << (type.is_even() ? "even" : "odd")
                      << "), " << value.size() << " bytes\n";
        }
    }
    std::cout << "\n";

    // Example 3: a peer sending a mandatory field we do not understand
    std::cout << "3. Unknown even record\n";
    Init future = init;
    future.tlvs.insert(Type(100), {0x01});
    print_result("decode", codec.decode(RequestCodec::encode(future)).status());
    std::cout << "\n";

    // Example 4: partial input from a streaming transport
    std::cout << "4. Partial input\n";
    print_result("first half",
                 codec.decode(wire.data(), wire.size() / 2, InputMode::PARTIAL).status());
    // a stream has no terminator, so partial input never completes an Init
    print_result("all bytes, partial",
                 codec.decode(wire.data(), wire.size(), InputMode::PARTIAL).status());
    print_result("all bytes, complete",
                 codec.decode(wire.data(), wire.size(), InputMode::COMPLETE).status());
    std::cout << "\n";

    // Example 5: strict encoding of the same stream
    std::cout << "5. Strict encoding\n";
    auto strict = strict_encode(init.tlvs);
    std::cout << "   " << strict.size() << " bytes: " << hex_preview(strict.data(), strict.size()) << "\n";
    print_result("decode", strict_decode(strict).status());

    return 0;
}

#include "lnp_strict_encoding.hpp"
#include "lnp_tlv.hpp"
#include <cstdint>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    lnp::DecodeOptions opts;
    opts.enforce_even_odd = size > 0 && (data[0] & 1);

    // Any stream that decodes must re-encode to the same bytes: there is
    // exactly one canonical encoding per stream.
    auto result = lnp::stream_decode(data, size, opts);
    if (result.is_ok()) {
        std::vector<uint8_t> again = lnp::stream_encode(result.value());
        if (again.size() != size || (size != 0 && std::memcmp(again.data(), data, size) != 0)) {
            std::abort();
        }
        lnp::check_even_odd(result.value(), nullptr);
    }

    // A partial buffer can never prove the stream is over
    auto partial = lnp::stream_decode(data, size / 2, opts, lnp::InputMode::PARTIAL);
    if (partial.is_ok()) std::abort();

    auto strict = lnp::strict_decode(data, size, opts);
    if (strict.is_ok() && !strict.value().empty()) {
        std::vector<uint8_t> again = lnp::strict_encode(strict.value());
        if (again.size() > size) std::abort();
    }

    return 0;
}

/**
 * @file hex.cpp
 * @brief Hex helpers backed by libsodium's constant-time codec
 */

#include "../include/lnp_hex.hpp"

#include <sodium.h>

namespace lnp {

std::string to_hex(const uint8_t* data, size_t len) {
    if (len == 0) return std::string();
    std::string out(len * 2 + 1, '\0');
    sodium_bin2hex(&out[0], out.size(), data, len);
    out.resize(len * 2);
    return out;
}

std::string to_hex(const std::vector<uint8_t>& data) {
    return to_hex(data.data(), data.size());
}

std::string hex_preview(const uint8_t* data, size_t len, size_t max_bytes) {
    if (len <= max_bytes) return to_hex(data, len);
    return to_hex(data, max_bytes) + "..(" + std::to_string(len) + " bytes)";
}

std::optional<std::vector<uint8_t>> from_hex(const std::string& hex) {
    std::vector<uint8_t> out(hex.size() / 2 + 1);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(out.data(), out.size(), hex.c_str(), hex.size(),
                       " :", &bin_len, &end) != 0) {
        return std::nullopt;
    }
    // sodium stops at the first non-hex, non-ignored character
    if (end != hex.c_str() + hex.size()) return std::nullopt;
    out.resize(bin_len);
    return out;
}

} // namespace lnp

#ifndef LNP_HEX_HPP
#define LNP_HEX_HPP

/**
 * @file lnp_hex.hpp
 * @brief Hex rendering for log lines and hex parsing for test vectors
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lnp {

std::string to_hex(const uint8_t* data, size_t len);
std::string to_hex(const std::vector<uint8_t>& data);

/**
 * @brief Lowercase hex of at most max_bytes, with "..(N bytes)" when cut
 */
std::string hex_preview(const uint8_t* data, size_t len, size_t max_bytes = 32);

/**
 * @brief Parse hex; spaces and ':' between byte pairs are ignored
 * @return std::nullopt on odd length or a non-hex character
 */
std::optional<std::vector<uint8_t>> from_hex(const std::string& hex);

} // namespace lnp

#endif // LNP_HEX_HPP

#ifndef LNP_STRICT_ENCODING_HPP
#define LNP_STRICT_ENCODING_HPP

/**
 * @file lnp_strict_encoding.hpp
 * @brief Count-prefixed little-endian encoding of a TLV Stream
 *
 * Used where a Stream is stored or passed over RPC rather than appended to a
 * Lightning message:
 *
 *   +---------------+---------------------------------------------------+
 *   | count (u16 LE)| count * ( type (u64 LE) | len (u16 LE) | bytes ) |
 *   +---------------+---------------------------------------------------+
 *
 * An empty stream encodes to zero bytes, and zero bytes decode to an empty
 * stream. A present count of zero is also accepted. A PARTIAL reader with no
 * bytes yet needs more input.
 */

#include "lnp_errors.hpp"
#include "lnp_tlv.hpp"
#include "lnp_wire.hpp"

#include <cstdint>
#include <vector>

namespace lnp {

/// Largest record count and value length the u16 prefixes can carry
constexpr size_t LNP_STRICT_MAX_LEN = 0xFFFF;

size_t strict_encoded_len(const Stream& stream);

/**
 * @throws std::length_error if the stream has more than LNP_STRICT_MAX_LEN
 *         records or a value longer than LNP_STRICT_MAX_LEN bytes
 */
void strict_encode_stream(const Stream& stream, ByteWriter& w);
std::vector<uint8_t> strict_encode(const Stream& stream);

/**
 * @brief Decode one strict-encoded stream
 *
 * Types must be strictly ascending (OUT_OF_ORDER_TYPE / DUPLICATE_TYPE);
 * each length is checked against max_record_len (RECORD_TOO_LARGE) before
 * allocation; a short buffer is TRUNCATED_INPUT, or NEED_MORE_INPUT in
 * PARTIAL mode. known_types and enforce_even_odd apply as for the
 * Lightning encoding.
 */
Status strict_decode_stream(ByteReader& r, const DecodeOptions& opts, Stream& out);

DecodeResult<Stream> strict_decode(const uint8_t* data, size_t len,
                                   const DecodeOptions& opts = {},
                                   InputMode mode = InputMode::COMPLETE);

DecodeResult<Stream> strict_decode(const std::vector<uint8_t>& data,
                                   const DecodeOptions& opts = {},
                                   InputMode mode = InputMode::COMPLETE);

} // namespace lnp

#endif // LNP_STRICT_ENCODING_HPP

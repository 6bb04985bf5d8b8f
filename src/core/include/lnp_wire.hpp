#ifndef LNP_WIRE_HPP
#define LNP_WIRE_HPP

/**
 * @file lnp_wire.hpp
 * @brief Wire primitives: byte cursor, output buffer, BigSize, length guard
 *
 * BigSize (canonical variable-length unsigned integer):
 *
 *   value range               encoding
 *   0x00 .. 0xFC              1 byte
 *   0xFD .. 0xFFFF            0xFD || u16 big-endian
 *   0x10000 .. 0xFFFFFFFF     0xFE || u32 big-endian
 *   larger                    0xFF || u64 big-endian
 *
 * Decoding rejects a wider form where a narrower one would fit.
 *
 * ByteReader never reads outside the range it was constructed with. In
 * PARTIAL mode running out of bytes mid-item yields NEED_MORE_INPUT instead
 * of an error, so a streaming caller can wait for the transport.
 */

#include "lnp_config.hpp"
#include "lnp_errors.hpp"

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace lnp {

class RecordRegistry;

/// Maximum Lightning message payload; the default allocation guard
constexpr size_t LNP_MSG_MAX_LEN = 0xFFFF;

enum class InputMode : uint8_t {
    COMPLETE,   // buffer holds exactly one record or message
    PARTIAL     // buffer is a prefix of a message still arriving
};

/**
 * @brief Parameters shared by every decode routine
 *
 * known_types is not owned and must outlive the decode call. With
 * enforce_even_odd set and no known_types, every even TLV type is rejected.
 */
struct DecodeOptions {
    size_t max_record_len = LNP_MSG_MAX_LEN;
    const RecordRegistry* known_types = nullptr;
    bool enforce_even_odd = false;

    /// Read presentation.max_record_len and presentation.enforce_even_odd
    static DecodeOptions from_config(const Config& cfg = Config::instance());
};

class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size, InputMode mode = InputMode::COMPLETE);
    explicit ByteReader(const std::vector<uint8_t>& data, InputMode mode = InputMode::COMPLETE);

    size_t size() const { return size_; }
    size_t position() const { return pos_; }
    size_t remaining() const { return size_ - pos_; }
    bool at_end() const { return pos_ == size_; }
    InputMode mode() const { return mode_; }
    bool is_partial() const { return mode_ == InputMode::PARTIAL; }
    const uint8_t* data() const { return data_; }
    const uint8_t* current() const { return data_ + pos_; }

    Status read_u8(uint8_t& out);
    Status read_u16_be(uint16_t& out);
    Status read_u32_be(uint32_t& out);
    Status read_u64_be(uint64_t& out);
    Status read_u16_le(uint16_t& out);
    Status read_u64_le(uint64_t& out);

    Status skip(size_t n);

    /// Copy the next n bytes into out (replacing its contents)
    Status read_bytes(size_t n, std::vector<uint8_t>& out);

    /// NEED_MORE_INPUT in PARTIAL mode, otherwise INVALID with err
    Status shortage(Error err = Error::TRUNCATED_INPUT) const;

private:
    Status require(size_t n) const;
    uint64_t take_be(size_t n);
    uint64_t take_le(size_t n);

    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
    InputMode mode_;
};

class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(size_t reserve) { buf_.reserve(reserve); }

    void write_u8(uint8_t v) { buf_.push_back(v); }
    void write_u16_be(uint16_t v);
    void write_u32_be(uint32_t v);
    void write_u64_be(uint64_t v);
    void write_u16_le(uint16_t v);
    void write_u64_le(uint64_t v);
    void write_bytes(const uint8_t* data, size_t len);
    void write_bytes(const std::vector<uint8_t>& data) { write_bytes(data.data(), data.size()); }

    size_t size() const { return buf_.size(); }
    const std::vector<uint8_t>& bytes() const { return buf_; }
    std::vector<uint8_t> take() { return std::move(buf_); }

private:
    std::vector<uint8_t> buf_;
};

namespace bigsize {

constexpr uint8_t MARKER_U16 = 0xFD;
constexpr uint8_t MARKER_U32 = 0xFE;
constexpr uint8_t MARKER_U64 = 0xFF;

size_t encoded_len(uint64_t value);
void encode(uint64_t value, ByteWriter& w);
std::vector<uint8_t> encode(uint64_t value);

/**
 * @brief Decode one canonical BigSize
 *
 * Truncation is MALFORMED_VARINT (COMPLETE) or NEED_MORE_INPUT (PARTIAL).
 * The cursor only advances on success.
 */
Status decode(ByteReader& r, uint64_t& out);

} // namespace bigsize

/**
 * @brief Read BigSize(length) || bytes[length]
 *
 * The declared length is checked against max_len before anything is
 * allocated (RECORD_TOO_LARGE). A length past the end of the buffer is
 * reported as overrun (COMPLETE) or NEED_MORE_INPUT (PARTIAL).
 */
Status read_var_bytes(ByteReader& r, size_t max_len, std::vector<uint8_t>& out,
                      Error overrun = Error::TRUNCATED_INPUT);

void write_var_bytes(ByteWriter& w, const uint8_t* data, size_t len);

} // namespace lnp

#endif // LNP_WIRE_HPP

/**
 * @file wire.cpp
 * @brief Byte cursor, output buffer and BigSize codec
 */

#include "../include/lnp_wire.hpp"

namespace lnp {

// ==================== ByteReader ====================

ByteReader::ByteReader(const uint8_t* data, size_t size, InputMode mode)
    : data_(data), size_(data ? size : 0), mode_(mode) {}

ByteReader::ByteReader(const std::vector<uint8_t>& data, InputMode mode)
    : data_(data.data()), size_(data.size()), mode_(mode) {}

Status ByteReader::shortage(Error err) const {
    return is_partial() ? Status::need_more_input() : Status::invalid(err);
}

Status ByteReader::require(size_t n) const {
    return n <= remaining() ? Status::ok() : shortage(Error::TRUNCATED_INPUT);
}

uint64_t ByteReader::take_be(size_t n) {
    uint64_t v = 0;
    for (size_t i = 0; i < n; ++i) {
        v = (v << 8) | data_[pos_ + i];
    }
    pos_ += n;
    return v;
}

uint64_t ByteReader::take_le(size_t n) {
    uint64_t v = 0;
    for (size_t i = 0; i < n; ++i) {
        v |= static_cast<uint64_t>(data_[pos_ + i]) << (8 * i);
    }
    pos_ += n;
    return v;
}

Status ByteReader::read_u8(uint8_t& out) {
    Status s = require(1);
    if (s) out = data_[pos_++];
    return s;
}

Status ByteReader::read_u16_be(uint16_t& out) {
    Status s = require(2);
    if (s) out = static_cast<uint16_t>(take_be(2));
    return s;
}

Status ByteReader::read_u32_be(uint32_t& out) {
    Status s = require(4);
    if (s) out = static_cast<uint32_t>(take_be(4));
    return s;
}

Status ByteReader::read_u64_be(uint64_t& out) {
    Status s = require(8);
    if (s) out = take_be(8);
    return s;
}

Status ByteReader::read_u16_le(uint16_t& out) {
    Status s = require(2);
    if (s) out = static_cast<uint16_t>(take_le(2));
    return s;
}

Status ByteReader::read_u64_le(uint64_t& out) {
    Status s = require(8);
    if (s) out = take_le(8);
    return s;
}

Status ByteReader::skip(size_t n) {
    Status s = require(n);
    if (s) pos_ += n;
    return s;
}

Status ByteReader::read_bytes(size_t n, std::vector<uint8_t>& out) {
    Status s = require(n);
    if (!s) return s;
    out.assign(data_ + pos_, data_ + pos_ + n);
    pos_ += n;
    return s;
}

// ==================== ByteWriter ====================

void ByteWriter::write_u16_be(uint16_t v) {
    buf_.push_back(static_cast<uint8_t>(v >> 8));
    buf_.push_back(static_cast<uint8_t>(v & 0xFF));
}

void ByteWriter::write_u32_be(uint32_t v) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buf_.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
    }
}

void ByteWriter::write_u64_be(uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buf_.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
    }
}

void ByteWriter::write_u16_le(uint16_t v) {
    buf_.push_back(static_cast<uint8_t>(v & 0xFF));
    buf_.push_back(static_cast<uint8_t>(v >> 8));
}

void ByteWriter::write_u64_le(uint64_t v) {
    for (int shift = 0; shift < 64; shift += 8) {
        buf_.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
    }
}

void ByteWriter::write_bytes(const uint8_t* data, size_t len) {
    if (len == 0) return;
    buf_.insert(buf_.end(), data, data + len);
}

// ==================== BigSize ====================

namespace bigsize {

size_t encoded_len(uint64_t value) {
    if (value < MARKER_U16) return 1;
    if (value <= 0xFFFF) return 3;
    if (value <= 0xFFFFFFFFULL) return 5;
    return 9;
}

void encode(uint64_t value, ByteWriter& w) {
    if (value < MARKER_U16) {
        w.write_u8(static_cast<uint8_t>(value));
    } else if (value <= 0xFFFF) {
        w.write_u8(MARKER_U16);
        w.write_u16_be(static_cast<uint16_t>(value));
    } else if (value <= 0xFFFFFFFFULL) {
        w.write_u8(MARKER_U32);
        w.write_u32_be(static_cast<uint32_t>(value));
    } else {
        w.write_u8(MARKER_U64);
        w.write_u64_be(value);
    }
}

std::vector<uint8_t> encode(uint64_t value) {
    ByteWriter w(9);
    encode(value, w);
    return w.take();
}

Status decode(ByteReader& r, uint64_t& out) {
    if (r.at_end()) return r.shortage(Error::MALFORMED_VARINT);

    const uint8_t marker = *r.current();
    size_t width = 0;
    uint64_t minimum = 0;
    switch (marker) {
        case MARKER_U16: width = 2; minimum = MARKER_U16;      break;
        case MARKER_U32: width = 4; minimum = 0x10000ULL;      break;
        case MARKER_U64: width = 8; minimum = 0x100000000ULL;  break;
        default: {
            uint8_t single = 0;
            Status s = r.read_u8(single);
            if (s) out = single;
            return s;
        }
    }

    // Marker and payload are consumed together so a short read leaves the
    // cursor where it was.
    if (r.remaining() < 1 + width) return r.shortage(Error::MALFORMED_VARINT);

    const uint8_t* p = r.current() + 1;
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        value = (value << 8) | p[i];
    }

    if (value < minimum) return Status::invalid(Error::MALFORMED_VARINT);

    Status s = r.skip(1 + width);
    if (s) out = value;
    return s;
}

} // namespace bigsize

// ==================== Length-prefixed bytes ====================

Status read_var_bytes(ByteReader& r, size_t max_len, std::vector<uint8_t>& out, Error overrun) {
    uint64_t len = 0;
    Status s = bigsize::decode(r, len);
    if (!s) return s;

    // Guard before allocation: a hostile length must never size a buffer.
    if (len > max_len) return Status::invalid(Error::RECORD_TOO_LARGE);
    if (len > r.remaining()) return r.shortage(overrun);

    return r.read_bytes(static_cast<size_t>(len), out);
}

void write_var_bytes(ByteWriter& w, const uint8_t* data, size_t len) {
    bigsize::encode(len, w);
    w.write_bytes(data, len);
}

} // namespace lnp

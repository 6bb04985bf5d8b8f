/**
 * @file strict_encoding.cpp
 * @brief Strict (count-prefixed) Stream encoding
 */

#include "../include/lnp_strict_encoding.hpp"
#include "../include/lnp_logger.hpp"

#include <stdexcept>
#include <string>

namespace lnp {

namespace {

Status reject(const Status& s, size_t offset, Type type) {
    LNP_LOG_DEBUG("strict tlv stream rejected at offset " + std::to_string(offset) +
                  " (type " + type.to_hex_string() + "): " + s.to_string());
    return s;
}

} // namespace

size_t strict_encoded_len(const Stream& stream) {
    if (stream.empty()) return 0;
    size_t len = 2;
    for (const auto& entry : stream) {
        len += 8 + 2 + entry.second.size();
    }
    return len;
}

void strict_encode_stream(const Stream& stream, ByteWriter& w) {
    if (stream.empty()) return;
    if (stream.size() > LNP_STRICT_MAX_LEN) {
        throw std::length_error("strict encoding: " + std::to_string(stream.size()) +
                                " records exceed the u16 count");
    }

    w.write_u16_le(static_cast<uint16_t>(stream.size()));
    for (const auto& [type, value] : stream) {
        if (value.size() > LNP_STRICT_MAX_LEN) {
            throw std::length_error("strict encoding: value of type " + type.to_hex_string() +
                                    " is " + std::to_string(value.size()) + " bytes");
        }
        w.write_u64_le(type.value());
        w.write_u16_le(static_cast<uint16_t>(value.size()));
        w.write_bytes(value.data(), value.size());
    }
}

std::vector<uint8_t> strict_encode(const Stream& stream) {
    ByteWriter w(strict_encoded_len(stream));
    strict_encode_stream(stream, w);
    return w.take();
}

Status strict_decode_stream(ByteReader& r, const DecodeOptions& opts, Stream& out) {
    Stream decoded;
    if (r.at_end()) {
        if (r.is_partial()) return Status::need_more_input();
        out = std::move(decoded);
        return Status::ok();
    }

    uint16_t count = 0;
    Status s = r.read_u16_le(count);
    if (!s) return s;

    bool have_prev = false;
    Type prev;
    for (uint16_t i = 0; i < count; ++i) {
        const size_t record_start = r.position();

        uint64_t raw_type = 0;
        s = r.read_u64_le(raw_type);
        if (!s) return s;
        const Type type(raw_type);

        if (have_prev && type <= prev) {
            return reject(Status::invalid(type == prev ? Error::DUPLICATE_TYPE
                                                       : Error::OUT_OF_ORDER_TYPE),
                          record_start, type);
        }
        if (opts.enforce_even_odd && type.is_even() &&
            (opts.known_types == nullptr || !opts.known_types->knows(type))) {
            return reject(Status::invalid(Error::UNKNOWN_EVEN_TYPE), record_start, type);
        }

        uint16_t len = 0;
        s = r.read_u16_le(len);
        if (!s) return s;
        if (len > opts.max_record_len) {
            return reject(Status::invalid(Error::RECORD_TOO_LARGE), record_start, type);
        }

        std::vector<uint8_t> bytes;
        s = r.read_bytes(len, bytes);
        if (!s) return s;
        RawValue value(std::move(bytes));

        if (opts.known_types != nullptr) {
            const RecordRegistry::Validator* validate = opts.known_types->find(type);
            if (validate != nullptr && !(*validate)(value)) {
                return reject(Status::invalid(Error::INVALID_RECORD_VALUE), record_start, type);
            }
        }

        decoded.append(type, std::move(value));
        prev = type;
        have_prev = true;
    }

    out = std::move(decoded);
    return Status::ok();
}

DecodeResult<Stream> strict_decode(const uint8_t* data, size_t len,
                                   const DecodeOptions& opts, InputMode mode) {
    ByteReader r(data, len, mode);
    Stream stream;
    Status s = strict_decode_stream(r, opts, stream);
    if (s && !r.at_end()) s = Status::invalid(Error::TRAILING_DATA);
    return DecodeResult<Stream>(s, std::move(stream));
}

DecodeResult<Stream> strict_decode(const std::vector<uint8_t>& data,
                                   const DecodeOptions& opts, InputMode mode) {
    return strict_decode(data.data(), data.size(), opts, mode);
}

} // namespace lnp

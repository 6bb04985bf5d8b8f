/**
 * @file tlv.cpp
 * @brief TLV stream encode/decode
 */

#include "../include/lnp_tlv.hpp"
#include "../include/lnp_hex.hpp"
#include "../include/lnp_logger.hpp"

#include <sstream>

namespace lnp {

namespace {

bool is_unknown(Type type, const RecordRegistry* known) {
    return known == nullptr || !known->knows(type);
}

void log_rejection(const ByteReader& r, size_t record_start, Type type, const Status& s) {
    LNP_LOG_DEBUG("tlv stream rejected at offset " + std::to_string(record_start) +
                  " (type " + type.to_hex_string() + "): " + s.to_string() +
                  " [" + hex_preview(r.data() + record_start, r.size() - record_start) + "]");
}

} // namespace

// ==================== Type ====================

std::string Type::to_hex_string() const {
    std::ostringstream oss;
    oss << "0x" << std::hex << value_;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, Type type) {
    return os << type.value();
}

// ==================== Stream ====================

const RawValue* Stream::get(Type type) const {
    auto it = records_.find(type);
    return it == records_.end() ? nullptr : &it->second;
}

bool Stream::insert(Type type, std::vector<uint8_t> value) {
    auto res = records_.insert_or_assign(type, RawValue(std::move(value)));
    return res.second;
}

bool Stream::insert(Type type, const uint8_t* data, size_t len) {
    return insert(type, std::vector<uint8_t>(data, data + len));
}

// ==================== Encoding ====================

size_t encoded_len(const Stream& stream) {
    size_t len = 0;
    for (const auto& [type, value] : stream) {
        len += bigsize::encoded_len(type.value());
        len += bigsize::encoded_len(value.size());
        len += value.size();
    }
    return len;
}

void encode_stream(const Stream& stream, ByteWriter& w) {
    for (const auto& [type, value] : stream) {
        bigsize::encode(type.value(), w);
        write_var_bytes(w, value.data(), value.size());
    }
}

std::vector<uint8_t> stream_encode(const Stream& stream) {
    ByteWriter w(encoded_len(stream));
    encode_stream(stream, w);
    return w.take();
}

// ==================== Decoding ====================

Status decode_stream(ByteReader& r, const DecodeOptions& opts, Stream& out) {
    Stream decoded;
    bool have_prev = false;
    Type prev;

    while (!r.at_end()) {
        const size_t record_start = r.position();

        uint64_t raw_type = 0;
        Status s = bigsize::decode(r, raw_type);
        if (!s) {
            if (s.is_invalid()) log_rejection(r, record_start, Type(), s);
            return s;
        }
        const Type type(raw_type);

        if (have_prev && type <= prev) {
            s = Status::invalid(type == prev ? Error::DUPLICATE_TYPE : Error::OUT_OF_ORDER_TYPE);
            log_rejection(r, record_start, type, s);
            return s;
        }

        if (opts.enforce_even_odd && type.is_even() && is_unknown(type, opts.known_types)) {
            s = Status::invalid(Error::UNKNOWN_EVEN_TYPE);
            log_rejection(r, record_start, type, s);
            return s;
        }

        std::vector<uint8_t> bytes;
        s = read_var_bytes(r, opts.max_record_len, bytes, Error::RECORD_TOO_LARGE);
        if (!s) {
            if (s.is_invalid()) log_rejection(r, record_start, type, s);
            return s;
        }
        RawValue value(std::move(bytes));

        if (opts.known_types != nullptr) {
            const RecordRegistry::Validator* validate = opts.known_types->find(type);
            if (validate != nullptr && !(*validate)(value)) {
                s = Status::invalid(Error::INVALID_RECORD_VALUE);
                log_rejection(r, record_start, type, s);
                return s;
            }
        }

        decoded.append(type, std::move(value));
        prev = type;
        have_prev = true;
    }

    // No terminator: a partial buffer ending on a record boundary may still
    // be missing records.
    if (r.is_partial()) return Status::need_more_input();

    out = std::move(decoded);
    return Status::ok();
}

DecodeResult<Stream> stream_decode(const uint8_t* data, size_t len,
                                   const DecodeOptions& opts, InputMode mode) {
    ByteReader r(data, len, mode);
    Stream stream;
    Status s = decode_stream(r, opts, stream);
    return DecodeResult<Stream>(s, std::move(stream));
}

DecodeResult<Stream> stream_decode(const std::vector<uint8_t>& data,
                                   const DecodeOptions& opts, InputMode mode) {
    return stream_decode(data.data(), data.size(), opts, mode);
}

Status check_even_odd(const Stream& stream, const RecordRegistry* known) {
    for (const auto& entry : stream) {
        const Type type = entry.first;
        if (type.is_even() && is_unknown(type, known)) {
            LNP_LOG_DEBUG("tlv stream rejected: unknown even type " + type.to_hex_string());
            return Status::invalid(Error::UNKNOWN_EVEN_TYPE);
        }
    }
    return Status::ok();
}

} // namespace lnp

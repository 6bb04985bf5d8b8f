#ifndef LNP_TLV_HPP
#define LNP_TLV_HPP

/**
 * @file lnp_tlv.hpp
 * @brief TLV stream: Type, RawValue, Stream and their Lightning encoding
 *
 * Wire format of a stream (no header, no trailer, no count):
 *
 *   +-----------------+-------------------+----------------+
 *   | BigSize(type)   | BigSize(length)   | value[length]  |  repeated
 *   +-----------------+-------------------+----------------+
 *
 * Records appear in strictly increasing type order. End of input at a record
 * boundary is the end of the stream. An empty stream is zero bytes, so a
 * message without extensions is byte-identical to one predating them.
 *
 * Even/odd rule: a consumer rejects a stream holding an even type it does
 * not know and keeps odd unknown types as opaque RawValues.
 */

#include "lnp_errors.hpp"
#include "lnp_registry.hpp"
#include "lnp_wire.hpp"

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace lnp {

/**
 * @brief TLV record type; also the BOLT even/odd classification
 */
class Type {
public:
    constexpr Type() = default;
    constexpr explicit Type(uint64_t value) : value_(value) {}

    constexpr uint64_t value() const { return value_; }
    constexpr bool is_even() const { return (value_ & 1) == 0; }
    constexpr bool is_odd() const { return (value_ & 1) != 0; }

    constexpr bool operator==(Type o) const { return value_ == o.value_; }
    constexpr bool operator!=(Type o) const { return value_ != o.value_; }
    constexpr bool operator<(Type o) const { return value_ < o.value_; }
    constexpr bool operator<=(Type o) const { return value_ <= o.value_; }
    constexpr bool operator>(Type o) const { return value_ > o.value_; }
    constexpr bool operator>=(Type o) const { return value_ >= o.value_; }

    /// "0x" followed by lowercase hex
    std::string to_hex_string() const;

private:
    uint64_t value_ = 0;
};

std::ostream& operator<<(std::ostream& os, Type type);

/**
 * @brief Opaque payload of one TLV record
 */
class RawValue {
public:
    RawValue() = default;
    explicit RawValue(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}
    RawValue(const uint8_t* data, size_t len) : bytes_(data, data + len) {}

    const uint8_t* data() const { return bytes_.data(); }
    size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }
    const std::vector<uint8_t>& bytes() const { return bytes_; }

    bool operator==(const RawValue& o) const { return bytes_ == o.bytes_; }
    bool operator!=(const RawValue& o) const { return bytes_ != o.bytes_; }

private:
    std::vector<uint8_t> bytes_;
};

/**
 * @brief Ordered Type -> RawValue collection; iteration order is wire order
 */
class Stream;

Status decode_stream(ByteReader& r, const DecodeOptions& opts, Stream& out);
Status strict_decode_stream(ByteReader& r, const DecodeOptions& opts, Stream& out);

class Stream {
public:
    using Map = std::map<Type, RawValue>;
    using const_iterator = Map::const_iterator;

    Stream() = default;

    /// nullptr when the type is absent
    const RawValue* get(Type type) const;

    /**
     * @brief Insert or overwrite a record
     * @return true if the type was new. false means the caller inserted the
     *         same type twice, which the wire format cannot carry; the later
     *         value replaces the earlier one.
     */
    bool insert(Type type, std::vector<uint8_t> value);
    bool insert(Type type, const uint8_t* data, size_t len);

    bool contains(Type type) const { return records_.count(type) != 0; }
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    const_iterator begin() const { return records_.begin(); }
    const_iterator end() const { return records_.end(); }

    bool operator==(const Stream& o) const { return records_ == o.records_; }
    bool operator!=(const Stream& o) const { return records_ != o.records_; }

private:
    friend Status decode_stream(ByteReader& r, const DecodeOptions& opts, Stream& out);
    friend Status strict_decode_stream(ByteReader& r, const DecodeOptions& opts, Stream& out);

    /// Decoders append in verified ascending order
    void append(Type type, RawValue value) {
        records_.emplace_hint(records_.end(), type, std::move(value));
    }

    Map records_;
};

/**
 * @brief Known-type table of a TLV consumer
 *
 * Each known type carries a validator that decides whether a record value is
 * acceptable (exact length, minimal inner encodings, ...). Types absent from
 * the table are unknown for the even/odd rule.
 */
class RecordRegistry {
public:
    using Validator = std::function<bool(const RawValue&)>;
    using Table = DispatchTable<Type, Validator>;
    using Entry = Table::Entry;

    RecordRegistry() = default;

    /// @throws std::logic_error when a type is listed twice
    RecordRegistry(std::initializer_list<Entry> entries)
        : table_(entries, "TLV record registry") {}

    bool knows(Type type) const { return table_.contains(type); }
    const Validator* find(Type type) const { return table_.find(type); }
    size_t size() const { return table_.size(); }

    static bool accept_any(const RawValue&) { return true; }

private:
    Table table_;
};

// ==================== Encoding ====================

size_t encoded_len(const Stream& stream);
void encode_stream(const Stream& stream, ByteWriter& w);
std::vector<uint8_t> stream_encode(const Stream& stream);

// ==================== Decoding ====================

/**
 * @brief Decode records until the reader is exhausted
 *
 * Per record: BigSize type; type must exceed the previous one
 * (OUT_OF_ORDER_TYPE / DUPLICATE_TYPE); with enforce_even_odd an unknown even
 * type is UNKNOWN_EVEN_TYPE; BigSize length checked against max_record_len
 * and the remaining input (RECORD_TOO_LARGE) before the value is copied;
 * a known type's validator must accept the value (INVALID_RECORD_VALUE).
 *
 * Only a COMPLETE reader can end the stream. A PARTIAL reader that runs out
 * of bytes, at a record boundary or not, yields NEED_MORE_INPUT.
 *
 * out is only assigned on success.
 */
Status decode_stream(ByteReader& r, const DecodeOptions& opts, Stream& out);

DecodeResult<Stream> stream_decode(const uint8_t* data, size_t len,
                                   const DecodeOptions& opts = {},
                                   InputMode mode = InputMode::COMPLETE);

DecodeResult<Stream> stream_decode(const std::vector<uint8_t>& data,
                                   const DecodeOptions& opts = {},
                                   InputMode mode = InputMode::COMPLETE);

/**
 * @brief Second-pass even/odd policy over an already decoded stream
 *
 * INVALID/UNKNOWN_EVEN_TYPE at the first even type not in known (a null
 * table knows nothing). Odd unknown types are left in place.
 */
Status check_even_odd(const Stream& stream, const RecordRegistry* known);

} // namespace lnp

#endif // LNP_TLV_HPP

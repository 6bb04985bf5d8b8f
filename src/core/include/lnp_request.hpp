#ifndef LNP_REQUEST_HPP
#define LNP_REQUEST_HPP

/**
 * @file lnp_request.hpp
 * @brief Request message set carried over the presentation layer
 *
 *   code    message   payload
 *   0x0001  Hello     BigSize(len) || UTF-8 text
 *   0x0003  Empty     -
 *   0x0005  NoArgs    -
 *   0x0010  Init      BigSize(len) || features || TLV stream
 *   0x0103  AddKeys   BigSize(count) || count * 33-byte secp256k1 keys
 */

#include "lnp_errors.hpp"
#include "lnp_message_codec.hpp"
#include "lnp_tlv.hpp"
#include "lnp_wire.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace lnp {

/// Compressed secp256k1 public key (0x02/0x03 || X)
using PublicKey = std::array<uint8_t, 33>;

/// Genesis block hash identifying a chain
using ChainHash = std::array<uint8_t, 32>;

/// true for a compressed key that decodes to a point on secp256k1
bool is_valid_public_key(const PublicKey& key);

/// Strict UTF-8 check: no overlongs, no surrogates, nothing above U+10FFFF
bool is_valid_utf8(const uint8_t* data, size_t len);

struct Hello {
    static constexpr uint16_t TYPE = 0x0001;

    std::string text;

    Hello() = default;
    explicit Hello(std::string t) : text(std::move(t)) {}

    void encode(ByteWriter& w) const;
    static Status decode(ByteReader& r, const DecodeOptions& opts, Hello& out);

    bool operator==(const Hello& o) const { return text == o.text; }
    bool operator!=(const Hello& o) const { return !(*this == o); }
};

struct Empty {
    static constexpr uint16_t TYPE = 0x0003;

    void encode(ByteWriter&) const {}
    static Status decode(ByteReader&, const DecodeOptions&, Empty&) { return Status::ok(); }

    bool operator==(const Empty&) const { return true; }
    bool operator!=(const Empty&) const { return false; }
};

struct NoArgs {
    static constexpr uint16_t TYPE = 0x0005;

    void encode(ByteWriter&) const {}
    static Status decode(ByteReader&, const DecodeOptions&, NoArgs&) { return Status::ok(); }

    bool operator==(const NoArgs&) const { return true; }
    bool operator!=(const NoArgs&) const { return false; }
};

/**
 * @brief Connection setup message with a TLV extension stream
 *
 * Known records: NETWORKS (concatenated 32-byte chain hashes) and
 * REMOTE_ADDRESS (opaque, at most 64 bytes). The stream is always decoded
 * with the even/odd rule on, whatever the caller's options say.
 */
struct Init {
    static constexpr uint16_t TYPE = 0x0010;

    static constexpr Type NETWORKS = Type(1);
    static constexpr Type REMOTE_ADDRESS = Type(3);
    static constexpr size_t MAX_REMOTE_ADDRESS_LEN = 64;

    std::vector<uint8_t> features;
    Stream tlvs;

    static const RecordRegistry& known_types();

    void set_networks(const std::vector<ChainHash>& chains);
    std::vector<ChainHash> networks() const;

    void encode(ByteWriter& w) const;
    static Status decode(ByteReader& r, const DecodeOptions& opts, Init& out);

    bool operator==(const Init& o) const { return features == o.features && tlvs == o.tlvs; }
    bool operator!=(const Init& o) const { return !(*this == o); }
};

struct AddKeys {
    static constexpr uint16_t TYPE = 0x0103;

    std::vector<PublicKey> keys;

    void encode(ByteWriter& w) const;

    /// Every key must be a valid secp256k1 point (INVALID_RECORD_VALUE)
    static Status decode(ByteReader& r, const DecodeOptions& opts, AddKeys& out);

    bool operator==(const AddKeys& o) const { return keys == o.keys; }
    bool operator!=(const AddKeys& o) const { return !(*this == o); }
};

using RequestCodec = MessageCodec<Hello, Empty, NoArgs, Init, AddKeys>;
using Request = RequestCodec::Message;

} // namespace lnp

#endif // LNP_REQUEST_HPP

/**
 * @file request.cpp
 * @brief Payload encoders/decoders of the request message set
 */

#include "../include/lnp_request.hpp"
#include "../include/lnp_logger.hpp"

#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <memory>
#include <tuple>

namespace lnp {

namespace {

using GroupPtr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;

/// Built once; only read afterwards, so shared by all decoding threads
const EC_GROUP* secp256k1_group() {
    static const GroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1), &EC_GROUP_free);
    return group.get();
}

} // namespace

// ==================== Validation helpers ====================

bool is_valid_public_key(const PublicKey& key) {
    if (key[0] != 0x02 && key[0] != 0x03) return false;

    const EC_GROUP* group = secp256k1_group();
    if (group == nullptr) {
        LNP_LOG_ERROR("OpenSSL has no secp256k1 group");
        return false;
    }

    EC_POINT* point = EC_POINT_new(group);
    bool valid = point != nullptr &&
                 EC_POINT_oct2point(group, point, key.data(), key.size(), nullptr) == 1;
    if (!valid) ERR_clear_error();

    EC_POINT_free(point);
    return valid;
}

bool is_valid_utf8(const uint8_t* data, size_t len) {
    size_t i = 0;
    while (i < len) {
        const uint8_t lead = data[i];
        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t extra;
        uint32_t cp;
        uint32_t min_cp;
        if ((lead & 0xE0) == 0xC0) {
            extra = 1; cp = lead & 0x1F; min_cp = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2; cp = lead & 0x0F; min_cp = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3; cp = lead & 0x07; min_cp = 0x10000;
        } else {
            return false;
        }

        if (len - i - 1 < extra) return false;
        for (size_t k = 1; k <= extra; ++k) {
            const uint8_t cont = data[i + k];
            if ((cont & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cont & 0x3F);
        }

        if (cp < min_cp || cp > 0x10FFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        i += extra + 1;
    }
    return true;
}

// ==================== Hello ====================

void Hello::encode(ByteWriter& w) const {
    write_var_bytes(w, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

Status Hello::decode(ByteReader& r, const DecodeOptions& opts, Hello& out) {
    std::vector<uint8_t> bytes;
    Status s = read_var_bytes(r, opts.max_record_len, bytes);
    if (!s) return s;

    if (!is_valid_utf8(bytes.data(), bytes.size())) {
        return Status::invalid(Error::INVALID_RECORD_VALUE);
    }
    out.text.assign(bytes.begin(), bytes.end());
    return Status::ok();
}

// ==================== Init ====================

const RecordRegistry& Init::known_types() {
    static const RecordRegistry registry{
        {NETWORKS, [](const RawValue& v) {
            return v.size() % std::tuple_size<ChainHash>::value == 0;
        }},
        {REMOTE_ADDRESS, [](const RawValue& v) {
            return v.size() <= MAX_REMOTE_ADDRESS_LEN;
        }},
    };
    return registry;
}

void Init::set_networks(const std::vector<ChainHash>& chains) {
    std::vector<uint8_t> value;
    value.reserve(chains.size() * std::tuple_size<ChainHash>::value);
    for (const auto& chain : chains) {
        value.insert(value.end(), chain.begin(), chain.end());
    }
    tlvs.insert(NETWORKS, std::move(value));
}

std::vector<ChainHash> Init::networks() const {
    std::vector<ChainHash> chains;
    const RawValue* value = tlvs.get(NETWORKS);
    if (value == nullptr) return chains;

    const size_t hash_len = std::tuple_size<ChainHash>::value;
    chains.resize(value->size() / hash_len);
    for (size_t i = 0; i < chains.size(); ++i) {
        std::copy_n(value->data() + i * hash_len, hash_len, chains[i].begin());
    }
    return chains;
}

void Init::encode(ByteWriter& w) const {
    write_var_bytes(w, features.data(), features.size());
    encode_stream(tlvs, w);
}

Status Init::decode(ByteReader& r, const DecodeOptions& opts, Init& out) {
    std::vector<uint8_t> features;
    Status s = read_var_bytes(r, opts.max_record_len, features);
    if (!s) return s;

    DecodeOptions stream_opts = opts;
    stream_opts.known_types = &known_types();
    stream_opts.enforce_even_odd = true;

    Stream tlvs;
    s = decode_stream(r, stream_opts, tlvs);
    if (!s) return s;

    out.features = std::move(features);
    out.tlvs = std::move(tlvs);
    return Status::ok();
}

// ==================== AddKeys ====================

void AddKeys::encode(ByteWriter& w) const {
    bigsize::encode(keys.size(), w);
    for (const auto& key : keys) {
        w.write_bytes(key.data(), key.size());
    }
}

Status AddKeys::decode(ByteReader& r, const DecodeOptions& opts, AddKeys& out) {
    const size_t key_len = std::tuple_size<PublicKey>::value;

    uint64_t count = 0;
    Status s = bigsize::decode(r, count);
    if (!s) return s;

    if (count > opts.max_record_len / key_len) {
        return Status::invalid(Error::RECORD_TOO_LARGE);
    }
    if (static_cast<size_t>(count) * key_len > r.remaining()) {
        return r.shortage();
    }

    std::vector<PublicKey> keys(static_cast<size_t>(count));
    for (auto& key : keys) {
        std::copy_n(r.current(), key_len, key.begin());
        s = r.skip(key_len);
        if (!s) return s;
        if (!is_valid_public_key(key)) {
            return Status::invalid(Error::INVALID_RECORD_VALUE);
        }
    }

    out.keys = std::move(keys);
    return Status::ok();
}

} // namespace lnp

#ifndef LNP_MESSAGE_CODEC_HPP
#define LNP_MESSAGE_CODEC_HPP

/**
 * @file lnp_message_codec.hpp
 * @brief Registry-based codec for a closed set of typed messages
 *
 *   +----------------------+---------------------+
 *   | type code (u16 BE)   | payload             |
 *   +----------------------+---------------------+
 *
 * Each message struct M supplies:
 *   static constexpr uint16_t TYPE;
 *   void encode(ByteWriter& w) const;
 *   static Status decode(ByteReader& r, const DecodeOptions& opts, M& out);
 *
 * and must be default constructible. The payload decoder consumes exactly
 * its own bytes; anything left over is TRAILING_DATA. Extensible messages end
 * in a TLV stream, which consumes to the end of the buffer.
 */

#include "lnp_errors.hpp"
#include "lnp_hex.hpp"
#include "lnp_logger.hpp"
#include "lnp_registry.hpp"
#include "lnp_wire.hpp"

#include <array>
#include <cstdint>
#include <sstream>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace lnp {

template <typename... Messages>
class MessageCodec {
    static_assert(sizeof...(Messages) > 0, "message set must not be empty");
    static_assert(all_distinct(std::array<uint16_t, sizeof...(Messages)>{{Messages::TYPE...}}),
                  "two messages share a type code");

public:
    using Message = std::variant<Messages...>;
    using DecodeFn = Status (*)(ByteReader&, const DecodeOptions&, Message&);
    using Registry = DispatchTable<uint16_t, DecodeFn>;

    explicit MessageCodec(const DecodeOptions& opts = DecodeOptions())
        : opts_(opts),
          registry_({typename Registry::Entry{Messages::TYPE, &decode_as<Messages>}...},
                    "message registry") {}

    const DecodeOptions& options() const { return opts_; }
    const Registry& registry() const { return registry_; }

    // ==================== Encoding ====================

    static void encode(const Message& msg, ByteWriter& w) {
        std::visit([&w](const auto& m) {
            using M = std::decay_t<decltype(m)>;
            w.write_u16_be(M::TYPE);
            m.encode(w);
        }, msg);
    }

    static std::vector<uint8_t> encode(const Message& msg) {
        ByteWriter w;
        encode(msg, w);
        return w.take();
    }

    static uint16_t type_code(const Message& msg) {
        return std::visit([](const auto& m) {
            return std::decay_t<decltype(m)>::TYPE;
        }, msg);
    }

    // ==================== Decoding ====================

    /**
     * @brief Decode one message occupying the rest of the reader
     *
     * out is only assigned on success.
     */
    Status decode(ByteReader& r, Message& out) const {
        const size_t start = r.position();

        uint16_t code = 0;
        Status s = r.read_u16_be(code);
        if (!s) return s;

        const DecodeFn* fn = registry_.find(code);
        if (fn == nullptr) {
            s = Status::invalid(Error::UNKNOWN_MESSAGE_TYPE);
            log_rejection(r, start, code, s);
            return s;
        }

        Message msg;
        s = (*fn)(r, opts_, msg);
        if (!s) {
            if (s.is_invalid()) log_rejection(r, start, code, s);
            return s;
        }

        if (!r.at_end()) {
            s = Status::invalid(Error::TRAILING_DATA);
            log_rejection(r, start, code, s);
            return s;
        }

        out = std::move(msg);
        return Status::ok();
    }

    DecodeResult<Message> decode(const uint8_t* data, size_t len,
                                 InputMode mode = InputMode::COMPLETE) const {
        ByteReader r(data, len, mode);
        Message msg;
        Status s = decode(r, msg);
        return DecodeResult<Message>(s, std::move(msg));
    }

    DecodeResult<Message> decode(const std::vector<uint8_t>& data,
                                 InputMode mode = InputMode::COMPLETE) const {
        return decode(data.data(), data.size(), mode);
    }

private:
    template <typename M>
    static Status decode_as(ByteReader& r, const DecodeOptions& opts, Message& out) {
        M msg;
        Status s = M::decode(r, opts, msg);
        if (s) out.template emplace<M>(std::move(msg));
        return s;
    }

    static void log_rejection(const ByteReader& r, size_t start, uint16_t code, const Status& s) {
        if (!Logger::instance().enabled(LogLevel::DEBUG)) return;
        std::ostringstream oss;
        oss << "message 0x" << std::hex << code << std::dec
            << " rejected at offset " << r.position() << ": " << s.to_string()
            << " [" << hex_preview(r.data() + start, r.size() - start) << "]";
        Logger::instance().debug(oss.str());
    }

    DecodeOptions opts_;
    Registry registry_;
};

} // namespace lnp

#endif // LNP_MESSAGE_CODEC_HPP

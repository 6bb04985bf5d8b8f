#ifndef LNP_ERRORS_HPP
#define LNP_ERRORS_HPP

/**
 * @file lnp_errors.hpp
 * @brief Decode error taxonomy and the three-way decode outcome
 *
 * Every decode path in the presentation layer reports one of:
 *   - OK               value produced, cursor advanced past exactly its bytes
 *   - NEED_MORE_INPUT  a PARTIAL buffer ended inside an item, or before a
 *                      TLV stream could be proven over; wait for bytes
 *   - INVALID          protocol violation; drop the peer, do not reprocess
 *
 * INVALID always carries one Error kind. No partially populated value is
 * ever handed out on a non-OK outcome.
 */

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace lnp {

/**
 * @brief Closed set of wire-level error kinds
 */
enum class Error : uint8_t {
    NONE = 0,
    MALFORMED_VARINT,       // BigSize non-minimal or truncated
    OUT_OF_ORDER_TYPE,      // TLV type lower than its predecessor
    DUPLICATE_TYPE,         // TLV type equal to its predecessor
    RECORD_TOO_LARGE,       // declared length over remaining input or max
    UNKNOWN_EVEN_TYPE,      // even TLV type not in the known-type table
    UNKNOWN_MESSAGE_TYPE,   // no registry entry for the message code
    TRUNCATED_INPUT,        // fewer bytes than a fixed field needs
    INVALID_RECORD_VALUE,   // known record or payload field failed validation
    TRAILING_DATA           // bytes left after a fixed-framing payload
};

enum class DecodeStatus : uint8_t {
    OK,
    NEED_MORE_INPUT,
    INVALID
};

const char* error_to_string(Error err);
const char* status_to_string(DecodeStatus status);

/**
 * @brief Outcome of a decode step that writes into an out-parameter
 */
class Status {
public:
    Status() = default;

    static Status ok() { return Status(); }
    static Status need_more_input() { return Status(DecodeStatus::NEED_MORE_INPUT, Error::NONE); }
    static Status invalid(Error err) { return Status(DecodeStatus::INVALID, err); }

    DecodeStatus code() const { return code_; }
    Error error() const { return error_; }

    bool is_ok() const { return code_ == DecodeStatus::OK; }
    bool needs_more_input() const { return code_ == DecodeStatus::NEED_MORE_INPUT; }
    bool is_invalid() const { return code_ == DecodeStatus::INVALID; }

    explicit operator bool() const { return is_ok(); }

    std::string to_string() const;

    bool operator==(const Status& other) const {
        return code_ == other.code_ && error_ == other.error_;
    }
    bool operator!=(const Status& other) const { return !(*this == other); }

private:
    Status(DecodeStatus code, Error err) : code_(code), error_(err) {}

    DecodeStatus code_ = DecodeStatus::OK;
    Error error_ = Error::NONE;
};

/**
 * @brief Status plus the decoded value on success
 *
 * value() on a failed result is a programming error and throws
 * std::logic_error.
 */
template <typename T>
class DecodeResult {
public:
    DecodeResult(Status status, T value)
        : status_(status) {
        if (status_.is_ok()) value_.emplace(std::move(value));
    }

    static DecodeResult success(T value) {
        return DecodeResult(Status::ok(), std::move(value));
    }

    static DecodeResult failure(Status status) {
        if (status.is_ok()) {
            throw std::logic_error("DecodeResult::failure called with OK status");
        }
        DecodeResult r;
        r.status_ = status;
        return r;
    }

    const Status& status() const { return status_; }
    DecodeStatus code() const { return status_.code(); }
    Error error() const { return status_.error(); }

    bool is_ok() const { return status_.is_ok(); }
    bool needs_more_input() const { return status_.needs_more_input(); }
    bool is_invalid() const { return status_.is_invalid(); }

    explicit operator bool() const { return is_ok(); }

    const T& value() const& {
        if (!value_) throw std::logic_error("DecodeResult has no value: " + status_.to_string());
        return *value_;
    }

    T&& value() && {
        if (!value_) throw std::logic_error("DecodeResult has no value: " + status_.to_string());
        return std::move(*value_);
    }

private:
    DecodeResult() = default;

    Status status_;
    std::optional<T> value_;
};

} // namespace lnp

#endif // LNP_ERRORS_HPP

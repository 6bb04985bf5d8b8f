#include "../include/lnp_errors.hpp"

namespace lnp {

const char* error_to_string(Error err) {
    switch (err) {
        case Error::NONE:                 return "none";
        case Error::MALFORMED_VARINT:     return "malformed varint";
        case Error::OUT_OF_ORDER_TYPE:    return "out-of-order TLV type";
        case Error::DUPLICATE_TYPE:       return "duplicate TLV type";
        case Error::RECORD_TOO_LARGE:     return "record too large";
        case Error::UNKNOWN_EVEN_TYPE:    return "unknown even TLV type";
        case Error::UNKNOWN_MESSAGE_TYPE: return "unknown message type";
        case Error::TRUNCATED_INPUT:      return "truncated input";
        case Error::INVALID_RECORD_VALUE: return "invalid record value";
        case Error::TRAILING_DATA:        return "trailing data";
        default:                          return "unknown error";
    }
}

const char* status_to_string(DecodeStatus status) {
    switch (status) {
        case DecodeStatus::OK:              return "ok";
        case DecodeStatus::NEED_MORE_INPUT: return "need more input";
        case DecodeStatus::INVALID:         return "invalid";
        default:                            return "?";
    }
}

std::string Status::to_string() const {
    if (code_ != DecodeStatus::INVALID) return status_to_string(code_);
    return std::string(status_to_string(code_)) + ": " + error_to_string(error_);
}

} // namespace lnp

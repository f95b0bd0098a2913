// -----------------------------------------------------------------------------
// protocol.cpp — names for hf2 error codes and channels
//
// API: see include/hf2/protocol.hpp
// -----------------------------------------------------------------------------
#include "hf2/protocol.hpp"

namespace hf2 {

const char* error_name(Error e) {
  switch (e) {
    case Error::Ok:                    return "ok";
    case Error::MalformedHeader:       return "malformed_header";
    case Error::LengthOverflow:        return "length_overflow";
    case Error::MessageTooLarge:       return "message_too_large";
    case Error::UnknownCommand:        return "unknown_command";
    case Error::UnsupportedCommand:    return "unsupported_command";
    case Error::TruncatedMessage:      return "truncated_message";
    case Error::PayloadLengthMismatch: return "payload_length_mismatch";
    case Error::UnknownStatus:         return "unknown_status";
    case Error::AlreadyAwaiting:       return "already_awaiting";
    case Error::UnexpectedTag:         return "unexpected_tag";
    case Error::Timeout:               return "timeout";
    case Error::Cancelled:             return "cancelled";
    case Error::NotAwaiting:           return "not_awaiting";
    case Error::TransportError:        return "transport_error";
  }
  return "unknown";                    // out-of-range value cast into the enum
}

const char* channel_name(Channel c) {
  switch (c) {
    case Channel::Command: return "command";
    case Channel::Stdout:  return "stdout";
    case Channel::Stderr:  return "stderr";
  }
  return "unknown";
}

} // namespace hf2

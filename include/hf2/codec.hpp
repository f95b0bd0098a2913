/**
 * @file codec.hpp
 * @brief hf2 message codec — binary encode/decode of commands and responses.
 *
 * @details
 * All multi-byte integers are little-endian.
 *
 * ```
 *   command : [u16 command_id][u16 tag][arguments...]
 *   response: [u16 tag][u8 status][u8 status_info][payload...]
 * ```
 *
 * Decoding is strict. A message either maps onto exactly one layout of the
 * command table or is rejected with a precise error:
 *
 * | Error                 | When                                                      |
 * |-----------------------|-----------------------------------------------------------|
 * | UnknownCommand        | encode: id outside the table, or args of the wrong layout |
 * | UnsupportedCommand    | decode: id outside the table                              |
 * | TruncatedMessage      | fewer bytes than the fixed part of the layout             |
 * | PayloadLengthMismatch | variable part disagrees with its declared/implied length  |
 * | UnknownStatus         | response status byte outside {0, 1, 2}                    |
 * | MessageTooLarge       | encoded form would not fit MAX_MESSAGE_SIZE               |
 *
 * Non-Ok responses decode with `results::None`; their payload is not
 * interpreted. Failures are values; nothing here allocates or throws.
 */
#ifndef HF2_CODEC_HPP
#define HF2_CODEC_HPP

#include <stdint.h>
#include <stddef.h>
#include "protocol.hpp"
#include "message.hpp"
#include "command.hpp"

namespace hf2 {

static constexpr size_t COMMAND_HEADER_SIZE  = 4;  ///< id + tag
static constexpr size_t RESPONSE_HEADER_SIZE = 4;  ///< tag + status + status_info

/// Encode a command. `out` is cleared first.
Error encode_command(const Command& cmd, ByteBuffer& out);

/// Decode a command (device side).
Error decode_command(const uint8_t* data, size_t len, Command& out);

/// Read only the fixed command prefix. Succeeds for ids outside the table.
Error peek_command_header(const uint8_t* data, size_t len, uint16_t& raw_id, uint16_t& tag);

/// Encode a response. When status is Ok, `request_id` must be in the table
/// and the data variant must match its layout; failure replies are always
/// header-only. `out` is cleared first.
Error encode_response(const Response& resp, CommandId request_id, ByteBuffer& out);

/**
 * @brief Decode a response against the id of the request it answers.
 *
 * Array payloads are checked for element alignment only.
 */
Error decode_response(const uint8_t* data, size_t len, CommandId request_id, Response& out);

/**
 * @brief Decode a response against the full request.
 *
 * Adds the implied-length check: a ChecksumPages or ReadWords reply must
 * carry exactly the number of elements the request asked for.
 */
Error decode_response(const uint8_t* data, size_t len, const Command& request, Response& out);

/// Read only the response tag.
Error peek_response_tag(const uint8_t* data, size_t len, uint16_t& tag);

// little-endian helpers, shared with host tooling and tests
inline void put_u16(ByteBuffer& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>(v >> 8));
}

inline void put_u32(ByteBuffer& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>(v >> 24));
}

inline uint16_t get_u16(const uint8_t* p) {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline uint32_t get_u32(const uint8_t* p) {
  return static_cast<uint32_t>(p[0])
       | (static_cast<uint32_t>(p[1]) << 8)
       | (static_cast<uint32_t>(p[2]) << 16)
       | (static_cast<uint32_t>(p[3]) << 24);
}

} // namespace hf2

#endif // HF2_CODEC_HPP

/**
 * @file packet.hpp
 * @brief hf2 Packet — one fixed-size HID report: 1 header byte + up to 63 payload bytes.
 *
 * @details
 * A `Packet` is the unit the transport moves. Its first byte packs the
 * packet kind (top two bits) and the payload length (low six bits); the
 * remaining 63 bytes hold the payload followed by zero padding.
 *
 * ### Byte layout (64 bytes total)
 *
 * | Byte  | Contents                 | Description                           |
 * |-------|--------------------------|---------------------------------------|
 * | 0     | `kind:2 + length:6`      | see hf2::PacketKind                   |
 * | 1..63 | payload, then zero bytes | only the first `length` bytes matter  |
 *
 * ### Examples
 * - `0x83 01 02 03 ...` → stdout chunk carrying `{01 02 03}`.
 * - `0xD0 ...`          → stderr chunk carrying 16 bytes.
 * - `0x40`              → final command fragment with no payload (empty message).
 * - `0x00`              → rejected: an inner fragment must carry bytes.
 *
 * Header coding is exposed as free functions (`encode_header`,
 * `decode_header`) so receivers can classify a report before copying it.
 * All operations are pure and allocation-free.
 */
#ifndef HF2_PACKET_HPP
#define HF2_PACKET_HPP

#include <stdint.h>
#include <stddef.h>
#include "protocol.hpp"

namespace hf2 {

/**
 * @brief Decode a packet header byte.
 *
 * @param header    Raw first byte of a report.
 * @param kind      Receives the packet kind.
 * @param length    Receives the declared payload length.
 * @param capacity  Report capacity in bytes (header included).
 *
 * @return Error::Ok, Error::MalformedHeader when an inner command fragment
 *         declares no payload, or Error::LengthOverflow when the length does
 *         not fit in `capacity - 1`.
 */
Error decode_header(uint8_t header, PacketKind& kind, uint8_t& length,
                    size_t capacity = PACKET_SIZE);

/**
 * @brief Encode a packet header byte.
 * @return Error::LengthOverflow if `length > PACKET_PAYLOAD_MAX`.
 */
Error encode_header(PacketKind kind, size_t length, uint8_t& out);

/**
 * @struct Packet
 * @brief One HID report worth of hf2 framing.
 *
 * @note Always `PACKET_SIZE` bytes on the wire; unused payload bytes are zero.
 */
struct Packet {
  uint8_t bytes[PACKET_SIZE];   ///< Raw report: header + payload + zero padding

  /// Zeroed packet; header 0x40 (empty final fragment).
  Packet();

  /**
   * @brief Build a packet from a payload slice.
   *
   * @return Error::LengthOverflow if `len > PACKET_PAYLOAD_MAX`; `out` is
   *         left untouched in that case.
   */
  static Error build(PacketKind kind, const uint8_t* payload, size_t len, Packet& out);

  /**
   * @brief Parse an incoming report.
   *
   * @details
   * Reports of 1..PACKET_SIZE bytes are accepted; some HID stacks trim
   * trailing zero bytes. The declared length must fit inside what arrived.
   *
   * @return Error::Ok, Error::MalformedHeader, or Error::LengthOverflow
   *         (empty report, report larger than PACKET_SIZE, or declared
   *         length beyond the received bytes).
   */
  static Error parse(const uint8_t* report, size_t len, Packet& out);

  PacketKind     kind() const    { return static_cast<PacketKind>(bytes[0] & HEADER_KIND_MASK); }
  uint8_t        length() const  { return bytes[0] & HEADER_LENGTH_MASK; }
  Channel        channel() const { return channel_of(kind()); }
  const uint8_t* payload() const { return bytes + 1; }
  uint8_t*       payload()       { return bytes + 1; }

  /// Bytes placed on the wire for this packet (always the full report).
  size_t         wire_size() const { return PACKET_SIZE; }
  const uint8_t* data() const      { return bytes; }
};

} // namespace hf2

#endif // HF2_PACKET_HPP

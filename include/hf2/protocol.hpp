/**
 * @file protocol.hpp
 * @brief hf2link protocol constants, packet kinds, channels and error codes.
 *
 * @details
 * ## Field Brief
 * Every byte that crosses the HID link is described here: the fixed packet
 * capacity, the four packet kinds carried in the top two bits of the header
 * byte, the logical channels those kinds map onto, and the closed set of
 * error codes every component reports.
 *
 * Nothing in this header allocates, throws, or touches a transport. It is
 * safe to include from MCU firmware and Linux host tools alike.
 *
 * ---
 *
 * @par Packet header byte
 * ```
 *   bit  7 6 | 5 4 3 2 1 0
 *        kind | payload length (0..63)
 * ```
 *
 * | kind                 | bits   | channel        |
 * |----------------------|--------|----------------|
 * | CommandMore          | `0x00` | command stream |
 * | CommandFinal         | `0x40` | command stream |
 * | SerialStdout         | `0x80` | serial stdout  |
 * | SerialStderr         | `0xC0` | serial stderr  |
 *
 * ---
 *
 * @par Configuration knobs (compile-time)
 * - `HF2_MAX_MESSAGE_SIZE`   largest logical message (default 1024 bytes).
 * - `HF2_DEFAULT_TIMEOUT_MS` correlator response timeout (default 1000 ms).
 * - `HF2_DIAGNOSTICS_CAP`    diagnostic event ring depth (default 16).
 *
 * Define them before including any hf2 header (or on the compiler command
 * line) to resize buffers for a particular board.
 */
#ifndef HF2_PROTOCOL_HPP
#define HF2_PROTOCOL_HPP

#include <stdint.h>
#include <stddef.h>

#ifndef HF2_MAX_MESSAGE_SIZE
#define HF2_MAX_MESSAGE_SIZE 1024
#endif

#ifndef HF2_DEFAULT_TIMEOUT_MS
#define HF2_DEFAULT_TIMEOUT_MS 1000
#endif

#ifndef HF2_DIAGNOSTICS_CAP
#define HF2_DIAGNOSTICS_CAP 16
#endif

namespace hf2 {

/// @name Wire capacities
///@{
static constexpr size_t   PACKET_SIZE          = 64;                   ///< Bytes per HID report (header + payload)
static constexpr size_t   PACKET_PAYLOAD_MAX   = PACKET_SIZE - 1;      ///< Payload bytes per packet
static constexpr size_t   MAX_MESSAGE_SIZE     = HF2_MAX_MESSAGE_SIZE; ///< Largest logical message
static constexpr uint32_t DEFAULT_TIMEOUT_MS   = HF2_DEFAULT_TIMEOUT_MS;
static constexpr size_t   DIAGNOSTICS_CAP      = HF2_DIAGNOSTICS_CAP;
///@}

static constexpr uint8_t  HEADER_KIND_MASK     = 0xC0; ///< Top two bits of the header byte
static constexpr uint8_t  HEADER_LENGTH_MASK   = 0x3F; ///< Low six bits of the header byte

static_assert(PACKET_PAYLOAD_MAX <= HEADER_LENGTH_MASK, "payload length must fit in 6 bits");
static_assert(MAX_MESSAGE_SIZE >= 64, "HF2_MAX_MESSAGE_SIZE too small for BinInfo/ReadWords replies");

/**
 * @brief Packet kind, stored verbatim in the top two bits of the header byte.
 */
enum class PacketKind : uint8_t {
  CommandMore  = 0x00,  ///< Inner command-stream fragment, more follow
  CommandFinal = 0x40,  ///< Last (or only) command-stream fragment
  SerialStdout = 0x80,  ///< Self-contained stdout diagnostic chunk
  SerialStderr = 0xC0   ///< Self-contained stderr diagnostic chunk
};

/**
 * @brief Logical channel a message travels on.
 */
enum class Channel : uint8_t {
  Command = 0,  ///< Request/response traffic (reassembled)
  Stdout  = 1,  ///< Serial diagnostic output
  Stderr  = 2   ///< Serial diagnostic error output
};

/**
 * @brief Every failure any hf2 component can report.
 *
 * @details
 * Values are stable; they travel in `status_info` of device error replies
 * and in diagnostic events, so new codes are only ever appended.
 */
enum class Error : uint8_t {
  Ok = 0,
  // transport level
  MalformedHeader       = 1,
  LengthOverflow        = 2,
  // reassembly / fragmentation
  MessageTooLarge       = 3,
  // message codec
  UnknownCommand        = 4,
  UnsupportedCommand    = 5,
  TruncatedMessage      = 6,
  PayloadLengthMismatch = 7,
  UnknownStatus         = 8,
  // correlation
  AlreadyAwaiting       = 9,
  UnexpectedTag         = 10,
  Timeout               = 11,
  Cancelled             = 12,
  NotAwaiting           = 13,
  // driver
  TransportError        = 14
};

/// Snake_case name for logs and key=value output ("message_too_large").
const char* error_name(Error e);

/// Short channel name ("command", "stdout", "stderr").
const char* channel_name(Channel c);

inline bool is_serial(PacketKind k) {
  return (static_cast<uint8_t>(k) & 0x80) != 0;  // both serial kinds carry the top bit
}

inline bool is_serial(Channel c) {
  return c != Channel::Command;
}

inline Channel channel_of(PacketKind k) {
  switch (k) {
    case PacketKind::SerialStdout: return Channel::Stdout;
    case PacketKind::SerialStderr: return Channel::Stderr;
    default:                       return Channel::Command;
  }
}

/// Serial packet kind for a serial channel (command maps to CommandFinal).
inline PacketKind serial_kind_of(Channel c) {
  switch (c) {
    case Channel::Stdout: return PacketKind::SerialStdout;
    case Channel::Stderr: return PacketKind::SerialStderr;
    default:              return PacketKind::CommandFinal;
  }
}

} // namespace hf2

#endif // HF2_PROTOCOL_HPP

/**
 * @file reassembler.hpp
 * @brief hf2 Reassembler — stateful packet → message decoder for one link.
 *
 * @details
 * Packets arrive one report at a time. Command-stream fragments are
 * accumulated until a final fragment closes the message; serial packets are
 * complete messages on their own and are yielded immediately, without
 * touching whatever command message is half-built.
 *
 * ```
 *            More                   More
 *   [Idle] ───────► [Accumulating] ──────┐
 *     │ ▲                 │   ▲          │
 *     │ └──── Final ──────┘   └──────────┘
 *     └─ Final (single-fragment message, stay Idle)
 *
 *   [Accumulating] ── overflow / bad header ──► [Discarding] ── Final ──► [Idle]
 * ```
 *
 * Failure model (all recoverable):
 * - **MalformedHeader / LengthOverflow**: the packet is dropped and any
 *   partial command message is discarded.
 * - **MessageTooLarge**: appending would pass the configured maximum; the
 *   partial message is discarded.
 *
 * A failure in the middle of a command message (or an overflow on an inner
 * fragment) enters Discarding: the remaining fragments of that message are
 * consumed as Pending and never yielded, up to and including its Final.
 * Serial packets still pass through while discarding. A tail is therefore
 * never mistaken for a message of its own.
 *
 * The transport is trusted to deliver packets in order. A reordered inner
 * fragment cannot be detected here and produces a corrupted message, which
 * the message codec then rejects.
 *
 * Same spirit as a byte-at-a-time SLIP decoder: one call per unit of input,
 * a completed message handed back through an out-parameter, and no heap.
 */
#ifndef HF2_REASSEMBLER_HPP
#define HF2_REASSEMBLER_HPP

#include <stdint.h>
#include <stddef.h>
#include "protocol.hpp"
#include "packet.hpp"
#include "message.hpp"

namespace hf2 {

/// Outcome of feeding one packet.
enum class FeedResult : uint8_t {
  Pending  = 0,  ///< Consumed; message not complete yet
  Complete = 1,  ///< A message was written to the out-parameter
  Dropped  = 2   ///< Packet rejected; see Reassembler::last_error()
};

class Reassembler {
public:
  enum class State : uint8_t { Idle = 0, Accumulating = 1, Discarding = 2 };

  /**
   * @param max_message_size Largest message accepted; clamped to MAX_MESSAGE_SIZE.
   */
  explicit Reassembler(size_t max_message_size = MAX_MESSAGE_SIZE);

  /**
   * @brief Feed a raw report as received from the transport.
   *
   * @param report Report bytes (header first, no HID report-number prefix).
   * @param len    Bytes received, 1..PACKET_SIZE.
   * @param out    Receives the message when the result is Complete.
   */
  FeedResult feed(const uint8_t* report, size_t len, Message& out);

  /// Feed an already-parsed packet.
  FeedResult feed(const Packet& packet, Message& out);

  /// Discard any partial command message and return to Idle (also ends Discarding).
  void abort();

  State  state() const            { return state_; }
  size_t pending_size() const     { return buffer_.size(); }
  size_t max_message_size() const { return max_; }

  /// Error behind the most recent Dropped result (Ok otherwise).
  Error  last_error() const       { return last_error_; }

private:
  /// Reset the buffer; `tail_follows` enters Discarding until the next Final.
  FeedResult drop(Error e, bool tail_follows);

  ByteBuffer buffer_;                 ///< Command-stream accumulation
  State      state_{State::Idle};
  size_t     max_;
  Error      last_error_{Error::Ok};
};

} // namespace hf2

#endif // HF2_REASSEMBLER_HPP

/**
 * @file fragmenter.hpp
 * @brief hf2 Fragmenter — lazily split one logical message into transport packets.
 *
 * @details
 * The fragmenter walks a caller-owned byte range in chunks of at most
 * `PACKET_PAYLOAD_MAX` (63) bytes and hands out one ready-to-send `Packet` per
 * `next()` call. Nothing is copied up front, so a 1 KiB flash page costs one
 * packet of RAM on an MCU, not seventeen.
 *
 * Kinds emitted:
 * - **Command stream**: every chunk but the last is `CommandMore`, the last
 *   is `CommandFinal`.
 * - **Serial channels**: every chunk is an independent `SerialStdout` /
 *   `SerialStderr` packet.
 *
 * An empty message produces exactly one zero-length packet on every channel
 * (a `CommandFinal` header, or a serial no-op), so
 * `reassemble(fragment(m)) == m` holds for all sizes up to the maximum.
 *
 * A message larger than the receiver's maximum is refused as a whole: the
 * sequence is empty and `error()` reports `MessageTooLarge`.
 *
 * @code
 * hf2::Fragmenter frag(bytes, len, hf2::Channel::Command);
 * hf2::Packet pkt;
 * while (frag.next(pkt)) {
 *   transport.send_report(pkt.data(), pkt.wire_size());
 * }
 * @endcode
 *
 * @warning The byte range must stay valid until the sequence is exhausted.
 *          To restart, construct a new Fragmenter over the same inputs.
 */
#ifndef HF2_FRAGMENTER_HPP
#define HF2_FRAGMENTER_HPP

#include <stdint.h>
#include <stddef.h>
#include "protocol.hpp"
#include "packet.hpp"

namespace hf2 {

class Fragmenter {
public:
  /**
   * @param data             Message bytes (may be nullptr when `len == 0`).
   * @param len              Message length.
   * @param channel          Channel the message travels on.
   * @param max_message_size Receiver maximum; clamped to MAX_MESSAGE_SIZE.
   */
  Fragmenter(const uint8_t* data, size_t len, Channel channel,
             size_t max_message_size = MAX_MESSAGE_SIZE);

  /**
   * @brief Produce the next packet.
   * @return true and fills `out` while packets remain; false once exhausted
   *         (or immediately if the message was refused).
   */
  bool next(Packet& out);

  /// Ok, or MessageTooLarge when the message was refused.
  Error  error() const        { return error_; }

  /// Total packets in the sequence (0 when refused).
  size_t packet_count() const { return count_; }

  /// Packets still to be produced.
  size_t remaining() const    { return count_ - emitted_; }

  bool   done() const         { return emitted_ >= count_; }

private:
  const uint8_t* data_;
  size_t         len_;
  Channel        channel_;
  size_t         offset_{0};
  size_t         count_{0};
  size_t         emitted_{0};
  Error          error_{Error::Ok};
};

} // namespace hf2

#endif // HF2_FRAGMENTER_HPP

/**
 * @file serial_demux.hpp
 * @brief hf2 SerialDemux — route stdout/stderr frames to diagnostic sinks.
 *
 * Serial frames are unsolicited: a device prints whenever it likes, including
 * between two fragments of a command reply. The reassembler already yields
 * them as standalone messages; this router hands their bytes to whichever
 * sink is registered for the channel, in arrival order.
 *
 * Sinks are plain function pointers with a user context, callable from
 * firmware and host alike. A channel without a sink still counts its bytes;
 * they are just not delivered anywhere. Zero-length frames are ignored.
 */
#ifndef HF2_SERIAL_DEMUX_HPP
#define HF2_SERIAL_DEMUX_HPP

#include <stdint.h>
#include <stddef.h>
#include "protocol.hpp"
#include "message.hpp"

namespace hf2 {

class SerialDemux {
public:
  using Sink = void (*)(void* user, Channel channel, const uint8_t* data, size_t len);

  /// Register (or clear, with nullptr) the sink for Stdout or Stderr.
  void set_sink(Channel channel, Sink fn, void* user);

  /**
   * @brief Deliver a serial message to its sink.
   * @return true if the message belonged to a serial channel (consumed),
   *         false for command-stream messages, which the caller keeps.
   */
  bool route(const Message& msg);

  uint32_t bytes_delivered(Channel channel) const;
  uint32_t frames_delivered(Channel channel) const;

private:
  struct Slot {
    Sink     fn{nullptr};
    void*    user{nullptr};
    uint32_t bytes{0};
    uint32_t frames{0};
  };

  Slot*       slot(Channel channel);
  const Slot* slot(Channel channel) const;

  Slot stdout_;
  Slot stderr_;
};

} // namespace hf2

#endif // HF2_SERIAL_DEMUX_HPP

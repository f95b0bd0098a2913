// -----------------------------------------------------------------------------
// serial_demux.cpp — serial channel routing
//
// API: see include/hf2/serial_demux.hpp
// -----------------------------------------------------------------------------
#include "hf2/serial_demux.hpp"

namespace hf2 {

SerialDemux::Slot* SerialDemux::slot(Channel channel) {
  if (channel == Channel::Stdout) return &stdout_;
  if (channel == Channel::Stderr) return &stderr_;
  return nullptr;
}

const SerialDemux::Slot* SerialDemux::slot(Channel channel) const {
  if (channel == Channel::Stdout) return &stdout_;
  if (channel == Channel::Stderr) return &stderr_;
  return nullptr;
}

void SerialDemux::set_sink(Channel channel, Sink fn, void* user) {
  Slot* s = slot(channel);
  if (!s) return;                      // command stream has no sink
  s->fn = fn;
  s->user = user;
}

bool SerialDemux::route(const Message& msg) {
  Slot* s = slot(msg.channel);
  if (!s) return false;                // command-stream: not ours
  if (msg.empty()) return true;        // zero-length frame is a no-op

  s->bytes += static_cast<uint32_t>(msg.size());
  ++s->frames;
  if (s->fn) s->fn(s->user, msg.channel, msg.bytes(), msg.size());
  return true;
}

uint32_t SerialDemux::bytes_delivered(Channel channel) const {
  const Slot* s = slot(channel);
  return s ? s->bytes : 0;
}

uint32_t SerialDemux::frames_delivered(Channel channel) const {
  const Slot* s = slot(channel);
  return s ? s->frames : 0;
}

} // namespace hf2

// -----------------------------------------------------------------------------
// fragmenter.cpp — message → packet sequence
//
// API: see include/hf2/fragmenter.hpp
// Usage tests: see tests/test_fragmenter.cpp
// -----------------------------------------------------------------------------
#include "hf2/fragmenter.hpp"

namespace hf2 {

Fragmenter::Fragmenter(const uint8_t* data, size_t len, Channel channel,
                       size_t max_message_size)
: data_(data), len_(len), channel_(channel) {
  const size_t max = max_message_size > MAX_MESSAGE_SIZE ? MAX_MESSAGE_SIZE : max_message_size;

  if (len_ > max || (len_ > 0 && !data_)) {
    error_ = Error::MessageTooLarge;   // refuse the whole message, never a prefix
    count_ = 0;
    return;
  }

  // ceil(len / 63), with an empty message still taking one packet
  count_ = (len_ == 0) ? 1 : (len_ + PACKET_PAYLOAD_MAX - 1) / PACKET_PAYLOAD_MAX;
}

bool Fragmenter::next(Packet& out) {
  if (emitted_ >= count_) return false;

  size_t chunk = len_ - offset_;
  if (chunk > PACKET_PAYLOAD_MAX) chunk = PACKET_PAYLOAD_MAX;

  const bool last = (emitted_ + 1 == count_);
  PacketKind kind;
  if (is_serial(channel_)) kind = serial_kind_of(channel_);
  else                     kind = last ? PacketKind::CommandFinal : PacketKind::CommandMore;

  const Error err = Packet::build(kind, data_ ? data_ + offset_ : nullptr, chunk, out);
  if (err != Error::Ok) {              // chunk <= 63, so only a null data pointer lands here
    error_ = err;
    emitted_ = count_;
    return false;
  }

  offset_ += chunk;
  ++emitted_;
  return true;
}

} // namespace hf2

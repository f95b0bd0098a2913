// -----------------------------------------------------------------------------
// reassembler.cpp — command-stream accumulation and serial pass-through
//
// API & state machine:
//   see include/hf2/reassembler.hpp
//
// Usage tests:
//   see tests/test_reassembler.cpp
// -----------------------------------------------------------------------------
#include "hf2/reassembler.hpp"

namespace hf2 {

Reassembler::Reassembler(size_t max_message_size)
: max_(max_message_size > MAX_MESSAGE_SIZE ? MAX_MESSAGE_SIZE : max_message_size) {
}

FeedResult Reassembler::feed(const uint8_t* report, size_t len, Message& out) {
  Packet pkt;
  const Error err = Packet::parse(report, len, pkt);
  if (err != Error::Ok) return drop(err, state_ != State::Idle);   // mid-message: skip to its Final
  return feed(pkt, out);
}

FeedResult Reassembler::feed(const Packet& packet, Message& out) {
  PacketKind kind;
  uint8_t len = 0;
  const Error err = decode_header(packet.bytes[0], kind, len);
  if (err != Error::Ok) return drop(err, state_ != State::Idle);

  last_error_ = Error::Ok;

  // Serial chunks stand alone; accumulation is left exactly as it was.
  if (is_serial(kind)) {
    if (len > max_) {                            // only reachable with a tiny runtime max
      last_error_ = Error::MessageTooLarge;
      return FeedResult::Dropped;
    }
    out.channel = channel_of(kind);
    out.assign(packet.payload(), len);
    return FeedResult::Complete;
  }

  // Tail of a message already thrown away: swallow through its Final.
  if (state_ == State::Discarding) {
    if (kind == PacketKind::CommandFinal) state_ = State::Idle;
    return FeedResult::Pending;
  }

  // Command stream: append, enforcing the runtime maximum before copying.
  if (buffer_.size() + len > max_) {
    return drop(Error::MessageTooLarge, kind == PacketKind::CommandMore);
  }

  const uint8_t* p = packet.payload();
  buffer_.insert(buffer_.end(), p, p + len);

  if (kind == PacketKind::CommandMore) {
    state_ = State::Accumulating;
    return FeedResult::Pending;
  }

  // Final fragment: hand the whole message over and start fresh.
  out.channel = Channel::Command;
  out.data = buffer_;
  buffer_.clear();
  state_ = State::Idle;
  return FeedResult::Complete;
}

void Reassembler::abort() {
  buffer_.clear();
  state_ = State::Idle;
}

FeedResult Reassembler::drop(Error e, bool tail_follows) {
  abort();                                       // partial data never leaks into the next message
  if (tail_follows) state_ = State::Discarding;
  last_error_ = e;
  return FeedResult::Dropped;
}

} // namespace hf2

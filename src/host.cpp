// -----------------------------------------------------------------------------
// host.cpp — Implementation of hf2::Host
//
// API & operational model:
//   see include/hf2/host.hpp
//
// Usage tests:
//   see tests/test_host_device.cpp
// -----------------------------------------------------------------------------
#include "hf2/host.hpp"
#include "hf2/fragmenter.hpp"
#include "hf2/packet.hpp"

namespace hf2 {

Host::Host(transport::ITransport& transport, uint32_t timeout_ms, size_t max_message_size)
: transport_(transport),
  max_(max_message_size > MAX_MESSAGE_SIZE ? MAX_MESSAGE_SIZE : max_message_size),
  reasm_(max_),
  corr_(timeout_ms, &diag_) {
}

// ---------- outbound ----------

Error Host::issue(Command& command, uint32_t now_ms) {
  const Error err = corr_.send(command, now_ms, tx_, max_);   // tag + encode + awaiting
  if (err != Error::Ok) return err;

  const Error tx = send_packets(tx_);
  if (tx != Error::Ok) {
    corr_.abandon(tx);                 // resolves the request; the tag is retired
    return tx;
  }
  return Error::Ok;
}

Error Host::issue(CommandId id, const CommandArgs& args, uint32_t now_ms, uint16_t* tag_out) {
  scratch_.id = id;
  scratch_.args = args;
  const Error err = issue(scratch_, now_ms);
  if (err == Error::Ok && tag_out) *tag_out = scratch_.tag;
  return err;
}

Error Host::send_packets(const ByteBuffer& bytes) {
  Fragmenter frag(bytes.data(), bytes.size(), Channel::Command, max_);
  if (frag.error() != Error::Ok) return frag.error();

  Packet pkt;
  while (frag.next(pkt)) {
    const transport::TxResult r = transport_.send_report(pkt.data(), pkt.wire_size());
    if (r != transport::TxResult::Ok) {
      diag_.push(Error::TransportError, Channel::Command, corr_.outstanding_tag(),
                 static_cast<uint32_t>(r));
      return Error::TransportError;
    }
    ++reports_out_;
  }
  return Error::Ok;
}

// ---------- inbound ----------

void Host::feed_report(const uint8_t* report, size_t len) {
  ++reports_in_;
  const FeedResult r = reasm_.feed(report, len, rx_);
  if (r == FeedResult::Dropped) {
    // detail: raw header byte, so a capture can be matched against the log
    diag_.push(reasm_.last_error(), Channel::Command, 0,
               (report && len) ? report[0] : 0);
    return;
  }
  if (r == FeedResult::Complete) handle_message(rx_);
}

void Host::handle_message(const Message& msg) {
  if (demux_.route(msg)) return;       // serial output never reaches the correlator
  corr_.on_message(msg);               // logs its own discards
}

void Host::poll(uint32_t now_ms) {
  uint8_t buf[PACKET_SIZE];
  bool stopped = false;                // transport ran dry or failed
  for (size_t i = 0; i < REPORTS_PER_POLL; ++i) {
    size_t n = 0;
    const transport::RxResult r = transport_.recv_report(buf, sizeof(buf), n);
    if (r == transport::RxResult::None) {
      stopped = true;
      break;
    }
    if (r == transport::RxResult::Error) {
      diag_.push(Error::TransportError, Channel::Command, 0, 0);
      stopped = true;
      break;
    }
    feed_report(buf, n);
  }

  // Cap hit mid-message: the rest is already queued, so judge the deadline
  // only once it has been read. A message ends within max_/63 packets.
  if (!stopped && reasm_.state() == Reassembler::State::Accumulating) return;

  // replies already queued above win over an expiring deadline
  corr_.poll_timeout(now_ms);
}

} // namespace hf2

// -----------------------------------------------------------------------------
// device.cpp — Implementation of hf2::Device
//
// API & reply policy:
//   see include/hf2/device.hpp
//
// Usage tests:
//   see tests/test_device.cpp, tests/test_host_device.cpp
// -----------------------------------------------------------------------------
#include "hf2/device.hpp"
#include "hf2/codec.hpp"
#include "hf2/fragmenter.hpp"
#include "hf2/packet.hpp"

#include <string.h>

namespace hf2 {

Device::Device(transport::ITransport& transport, CommandHandler& handler, size_t max_message_size)
: transport_(transport),
  handler_(handler),
  max_(max_message_size > MAX_MESSAGE_SIZE ? MAX_MESSAGE_SIZE : max_message_size),
  reasm_(max_) {
}

// ---------- inbound ----------

void Device::feed_report(const uint8_t* report, size_t len) {
  const FeedResult r = reasm_.feed(report, len, rx_);
  if (r == FeedResult::Dropped) {
    diag_.push(reasm_.last_error(), Channel::Command, 0, (report && len) ? report[0] : 0);
    return;
  }
  if (r == FeedResult::Complete) handle_message(rx_);
}

void Device::poll() {
  uint8_t buf[PACKET_SIZE];
  for (size_t i = 0; i < REPORTS_PER_POLL; ++i) {
    size_t n = 0;
    const transport::RxResult r = transport_.recv_report(buf, sizeof(buf), n);
    if (r == transport::RxResult::None) break;
    if (r == transport::RxResult::Error) {
      diag_.push(Error::TransportError, Channel::Command, 0, 0);
      break;
    }
    feed_report(buf, n);
  }
}

void Device::handle_message(const Message& msg) {
  // Hosts do not send serial traffic; log and move on.
  if (msg.is_serial()) {
    diag_.push(Error::UnsupportedCommand, msg.channel, 0, static_cast<uint32_t>(msg.size()));
    return;
  }

  uint16_t raw_id = 0;
  uint16_t tag = 0;
  if (peek_command_header(msg.bytes(), msg.size(), raw_id, tag) != Error::Ok) {
    diag_.push(Error::TruncatedMessage, Channel::Command, 0, static_cast<uint32_t>(msg.size()));
    ++rejected_;
    return;                            // no tag, nobody to answer
  }

  const Error err = decode_command(msg.bytes(), msg.size(), cmd_);
  if (err == Error::UnsupportedCommand) {
    diag_.push(err, Channel::Command, tag, raw_id);
    ++rejected_;
    reply(make_error(tag, ResponseStatus::NotRecognized), static_cast<CommandId>(raw_id));
    return;
  }
  if (err != Error::Ok) {
    diag_.push(err, Channel::Command, tag, raw_id);
    ++rejected_;
    reply(make_error(tag, ResponseStatus::ExecutionError, static_cast<uint8_t>(err)),
          static_cast<CommandId>(raw_id));
    return;
  }

  resp_ = make_ok(cmd_.tag);
  handler_.handle(cmd_, resp_);
  resp_.tag = cmd_.tag;                // handlers cannot misaddress a reply
  ++handled_;
  reply(resp_, cmd_.id);
}

// ---------- outbound ----------

void Device::reply(const Response& resp, CommandId request_id) {
  Error err = encode_response(resp, request_id, tx_);
  if (err == Error::Ok && tx_.size() > max_) err = Error::MessageTooLarge;

  if (err != Error::Ok) {
    // handler produced something the wire cannot carry
    diag_.push(err, Channel::Command, resp.tag, static_cast<uint16_t>(request_id));
    const Response fallback = make_error(resp.tag, ResponseStatus::ExecutionError,
                                         static_cast<uint8_t>(err));
    if (encode_response(fallback, request_id, tx_) != Error::Ok) return;
  }

  const Error tx = send_message(Channel::Command, tx_.data(), tx_.size());
  if (tx != Error::Ok) diag_.push(tx, Channel::Command, resp.tag, 0);
}

Error Device::send_message(Channel channel, const uint8_t* data, size_t len) {
  Fragmenter frag(data, len, channel, max_);
  if (frag.error() != Error::Ok) return frag.error();

  Packet pkt;
  while (frag.next(pkt)) {
    if (transport_.send_report(pkt.data(), pkt.wire_size()) != transport::TxResult::Ok) {
      return Error::TransportError;
    }
  }
  return Error::Ok;
}

Error Device::print(const char* text) {
  if (!text) return Error::Ok;
  return write_stdout(reinterpret_cast<const uint8_t*>(text), strlen(text));
}

} // namespace hf2

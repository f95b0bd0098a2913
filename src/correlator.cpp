// -----------------------------------------------------------------------------
// correlator.cpp — single-outstanding-request tracking
//
// API & state machine:
//   see include/hf2/correlator.hpp
//
// Usage tests:
//   see tests/test_correlator.cpp
// -----------------------------------------------------------------------------
#include "hf2/correlator.hpp"
#include "hf2/codec.hpp"

namespace hf2 {

Correlator::Correlator(uint32_t timeout_ms, Diagnostics* diag)
: diag_(diag), timeout_ms_(timeout_ms) {
}

// ---------- issue ----------

Error Correlator::send(Command& command, uint32_t now_ms, ByteBuffer& out,
                       size_t max_message_size) {
  if (state_ == State::AwaitingResponse) return Error::AlreadyAwaiting;

  const uint16_t saved_next = next_tag_;
  command.tag = allocate_tag();

  Error err = encode_command(command, out);
  if (err == Error::Ok && out.size() > max_message_size) err = Error::MessageTooLarge;
  if (err != Error::Ok) {
    next_tag_ = saved_next;            // an unsent command does not burn a tag
    return err;
  }

  // Keep what the reply decoder needs: id, tag, and the element count for
  // ranged reads. Bulk write payloads are not copied.
  request_.id  = command.id;
  request_.tag = command.tag;
  if (const args::Range* r = etl::get_if<args::Range>(&command.args)) {
    request_.args.emplace<args::Range>(*r);
  } else {
    request_.args.emplace<args::None>();
  }

  issued_at_ = now_ms;
  state_ = State::AwaitingResponse;
  return Error::Ok;
}

uint16_t Correlator::allocate_tag() {
  uint16_t tag = next_tag_++;          // uint16_t wraps 0xFFFF -> 0
  if (has_abandoned_ && tag == abandoned_tag_) {
    tag = next_tag_++;                 // never reuse the tag a late reply may still carry
  }
  return tag;
}

// ---------- inbound ----------

Error Correlator::on_message(const Message& msg) {
  if (msg.channel != Channel::Command) return Error::Ok;   // serial traffic is not ours

  uint16_t tag = 0;
  if (peek_response_tag(msg.bytes(), msg.size(), tag) != Error::Ok) {
    if (diag_) diag_->push(Error::TruncatedMessage, Channel::Command, 0, static_cast<uint32_t>(msg.size()));
    return Error::TruncatedMessage;
  }

  if (state_ != State::AwaitingResponse || tag != request_.tag) {
    // detail carries the tag we were waiting for, or 0x10000 when idle
    const uint32_t expected = (state_ == State::AwaitingResponse) ? request_.tag : 0x10000u;
    if (diag_) diag_->push(Error::UnexpectedTag, Channel::Command, tag, expected);
    return Error::UnexpectedTag;
  }

  const Error err = decode_response(msg.bytes(), msg.size(), request_, scratch_);
  resolve(err, err == Error::Ok ? &scratch_ : nullptr);
  return Error::Ok;
}

bool Correlator::poll_timeout(uint32_t now_ms) {
  if (state_ != State::AwaitingResponse) return false;
  const uint32_t elapsed = now_ms - issued_at_;            // wrap-safe
  if (elapsed <= timeout_ms_) return false;
  abandon(Error::Timeout);
  return true;
}

Error Correlator::cancel() {
  if (state_ != State::AwaitingResponse) return Error::NotAwaiting;
  abandon(Error::Cancelled);
  return Error::Ok;
}

void Correlator::abandon(Error reason) {
  if (state_ != State::AwaitingResponse) return;
  abandoned_tag_ = request_.tag;
  has_abandoned_ = true;
  resolve(reason, nullptr);
}

// ---------- resolution ----------

void Correlator::resolve(Error err, const Response* resp) {
  result_.tag     = request_.tag;
  result_.command = request_.id;
  result_.error   = err;
  if (resp) {
    result_.response = *resp;
  } else {
    result_.response = make_error(request_.tag, ResponseStatus::ExecutionError);
  }
  has_result_ = true;
  state_ = State::Idle;                // slot freed before the callback may issue again

  if (on_complete_) on_complete_(on_complete_user_, result_);
}

bool Correlator::take_result(Result& out) {
  if (!has_result_) return false;
  out = result_;
  has_result_ = false;
  return true;
}

} // namespace hf2

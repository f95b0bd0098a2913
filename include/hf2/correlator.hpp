/**
 * @file correlator.hpp
 * @brief hf2 Correlator — host-side tag allocation and request/response matching.
 *
 * @details
 * ## Field Brief
 * The host talks to a device one request at a time. The Correlator stamps
 * each outgoing command with a 16-bit tag, remembers what it is waiting for,
 * and resolves the request exactly once: with the matching response, with a
 * decode error for that response, with `Timeout`, or with `Cancelled`.
 *
 * ```
 *            send()                      on_message(tag match)
 *   [Idle] ─────────► [AwaitingResponse] ──────────────────────► [Idle]
 *     ▲                     │   │                                 result slot
 *     │                     │   └─ poll_timeout() → Timeout ─────► filled once
 *     └─────────────────────┴─ cancel() / abandon() ──────────────►
 * ```
 *
 * ---
 *
 * @par Tags
 * A wrapping 16-bit counter. The tag of the most recently abandoned request
 * (timed out, cancelled, or failed mid-send) is skipped once the counter comes
 * back around, so a late reply to it can never be mistaken for a reply to a
 * newer request.
 *
 * @par Stray responses
 * A response whose tag does not match the outstanding request (or that
 * arrives while nothing is outstanding) is discarded, logged as
 * `UnexpectedTag` in the attached Diagnostics, and leaves the outstanding
 * request untouched.
 *
 * @par Results
 * Resolution fills a single result slot drained by `take_result()`, and
 * calls the completion callback if one is installed. Issuing a new request
 * before draining the slot is allowed; the slot then holds whichever request
 * resolved last.
 *
 * @par Time
 * `now_ms` is any monotonically increasing 32-bit millisecond clock
 * (`millis()`, steady_clock truncated). Elapsed time is computed with
 * wrapping subtraction, so a clock rollover mid-request is harmless.
 */
#ifndef HF2_CORRELATOR_HPP
#define HF2_CORRELATOR_HPP

#include <stdint.h>
#include <stddef.h>
#include "protocol.hpp"
#include "message.hpp"
#include "command.hpp"
#include "diagnostics.hpp"

namespace hf2 {

/// Outcome of one request.
struct Result {
  uint16_t  tag{0};
  CommandId command{CommandId::BinInfo};
  Error     error{Error::Ok};   ///< Ok means `response` holds the decoded reply
  Response  response;
};

class Correlator {
public:
  enum class State : uint8_t { Idle = 0, AwaitingResponse = 1 };

  using CompletionFn = void (*)(void* user, const Result& result);

  explicit Correlator(uint32_t timeout_ms = DEFAULT_TIMEOUT_MS, Diagnostics* diag = nullptr);

  /**
   * @brief Stamp a tag on `command`, encode it into `out`, and start awaiting.
   *
   * @param max_message_size Receiver limit; a larger encoding is refused with
   *        Error::MessageTooLarge.
   *
   * @return Error::AlreadyAwaiting while a request is outstanding, or the
   *         codec error if the command does not encode. On any error the
   *         state is unchanged and no tag is consumed.
   */
  Error send(Command& command, uint32_t now_ms, ByteBuffer& out,
             size_t max_message_size = MAX_MESSAGE_SIZE);

  /**
   * @brief Offer a reassembled command-stream message.
   *
   * @return Error::Ok if it resolved the outstanding request (the result
   *         itself may carry a decode error), Error::UnexpectedTag or
   *         Error::TruncatedMessage if it was discarded. Serial messages are
   *         ignored and return Error::Ok.
   */
  Error on_message(const Message& msg);

  /// Resolve with Timeout if the deadline passed. True when it fired.
  bool poll_timeout(uint32_t now_ms);

  /// Resolve the outstanding request with Cancelled; NotAwaiting if idle.
  Error cancel();

  /// Resolve the outstanding request with `reason` (transport failure mid-send).
  void abandon(Error reason);

  /// Drain the result slot. False if nothing resolved since the last call.
  bool take_result(Result& out);
  bool has_result() const { return has_result_; }

  void set_completion_callback(CompletionFn fn, void* user) {
    on_complete_ = fn;
    on_complete_user_ = user;
  }

  void     set_timeout_ms(uint32_t ms) { timeout_ms_ = ms; }
  uint32_t timeout_ms() const          { return timeout_ms_; }

  /// Seed the tag counter (hosts may start from a random value per session).
  void     set_next_tag(uint16_t tag)  { next_tag_ = tag; }

  State     state() const               { return state_; }
  bool      awaiting() const            { return state_ == State::AwaitingResponse; }
  uint16_t  outstanding_tag() const     { return request_.tag; }
  CommandId outstanding_command() const { return request_.id; }

private:
  uint16_t allocate_tag();
  void     resolve(Error err, const Response* resp);

  Diagnostics* diag_;
  uint32_t     timeout_ms_;
  State        state_{State::Idle};

  Command      request_;                 ///< id, tag and element count of the outstanding request
  uint32_t     issued_at_{0};

  uint16_t     next_tag_{1};
  uint16_t     abandoned_tag_{0};
  bool         has_abandoned_{false};

  Result       result_;
  bool         has_result_{false};
  Response     scratch_;                 ///< decode target, kept off the stack

  CompletionFn on_complete_{nullptr};
  void*        on_complete_user_{nullptr};
};

} // namespace hf2

#endif // HF2_CORRELATOR_HPP

/**
 * @file diagnostics.hpp
 * @brief hf2 Diagnostics — bounded event log for recoverable link conditions.
 *
 * @details
 * The engine never prints. Anything worth a log line (a malformed header, a
 * response with a stray tag, an oversize message) becomes a
 * `DiagnosticEvent` queued here. Wrappers drain the queue the same way they
 * drain any other outbox and decide where the text goes: a UART on the
 * device, `key=value` lines on stderr in `hf2-cli`.
 *
 * - Fixed capacity (`DIAGNOSTICS_CAP`); when full, the oldest event is
 *   evicted and counted in `dropped()`.
 * - Optional observer called synchronously on every push, for firmware that
 *   wants to blink an LED or bump a counter without polling.
 */
#ifndef HF2_DIAGNOSTICS_HPP
#define HF2_DIAGNOSTICS_HPP

#include <stdint.h>
#include <stddef.h>
#include "etl/deque.h"
#include "protocol.hpp"

namespace hf2 {

struct DiagnosticEvent {
  Error    code{Error::Ok};
  Channel  channel{Channel::Command};
  uint16_t tag{0};        ///< Tag involved, when there is one
  uint32_t detail{0};     ///< Code-specific: byte count, expected tag, header byte...
};

class Diagnostics {
public:
  using Observer = void (*)(void* user, const DiagnosticEvent& evt);

  /// Record an event; evicts the oldest when full.
  void push(const DiagnosticEvent& evt) {
    if (events_.full()) {
      events_.pop_front();
      ++dropped_;
    }
    events_.push_back(evt);
    ++total_;
    if (observer_) observer_(observer_user_, evt);
  }

  void push(Error code, Channel channel, uint16_t tag = 0, uint32_t detail = 0) {
    DiagnosticEvent evt;
    evt.code = code;
    evt.channel = channel;
    evt.tag = tag;
    evt.detail = detail;
    push(evt);
  }

  /// Dequeue the oldest event. Returns false when empty.
  bool get_event(DiagnosticEvent& out) {
    if (events_.empty()) return false;
    out = events_.front();
    events_.pop_front();
    return true;
  }

  void set_observer(Observer fn, void* user) {
    observer_ = fn;
    observer_user_ = user;
  }

  size_t   pending() const { return events_.size(); }
  uint32_t dropped() const { return dropped_; }   ///< Evicted before being drained
  uint32_t total() const   { return total_; }     ///< Ever pushed
  void     clear()         { events_.clear(); }

private:
  etl::deque<DiagnosticEvent, DIAGNOSTICS_CAP> events_;
  uint32_t dropped_{0};
  uint32_t total_{0};
  Observer observer_{nullptr};
  void*    observer_user_{nullptr};
};

} // namespace hf2

#endif // HF2_DIAGNOSTICS_HPP

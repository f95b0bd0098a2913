/**
 * @file host.hpp
 * @brief hf2 Host — the host-side link driver: issue commands, collect replies, route serial.
 *
 * @details
 * ## Field Brief
 * `Host` is what a flashing tool or a diagnostics console talks to. It owns
 * nothing but fixed buffers and a reference to a report transport, and it
 * wires the engine's parts together:
 *
 * ```
 *   issue(cmd) ─► Correlator (tag, outstanding) ─► Codec ─► Fragmenter ─► transport
 *
 *   transport ─► feed_report() ─► Reassembler ─┬─ serial ──► SerialDemux ─► sinks
 *                                              └─ command ─► Correlator ─► result slot / callback
 * ```
 *
 * ---
 *
 * @par Operational model
 * - Single-threaded and non-blocking. `issue()` encodes and pushes every
 *   packet of the request to the transport immediately; it never waits.
 * - `poll(now_ms)` pulls at most `REPORTS_PER_POLL` reports from the
 *   transport, then checks the response deadline. Drivers that receive
 *   reports through a callback call `feed_report()` instead and still call
 *   `poll()` for the deadline.
 * - Exactly one request may be outstanding. A second `issue()` before the
 *   first resolves returns `Error::AlreadyAwaiting`.
 * - Every request resolves exactly once: reply, decode error, `Timeout`,
 *   `Cancelled`, or `TransportError`. Collect it with `take_result()` or the
 *   completion callback.
 *
 * ---
 *
 * @par Failure model
 * - **Transport rejects a packet mid-request:** the request resolves with
 *   `TransportError` and the call returns it. The device may have seen a
 *   partial message; its own reassembler discards it on the next final
 *   fragment or overflow.
 * - **Garbage on the link:** dropped and logged in `diagnostics()`; the next
 *   well-formed message is processed normally.
 * - **Stray or late reply:** logged as `UnexpectedTag`, never resolves the
 *   wrong request.
 *
 * ---
 *
 * @par Minimal usage
 * @code
 * hf2::transport::LinuxHidraw link;
 * link.open("/dev/hidraw3");
 * hf2::Host host(link, 500);
 *
 * hf2::Command cmd = hf2::make_bin_info();
 * if (host.issue(cmd, now_ms()) == hf2::Error::Ok) {
 *   hf2::Result res;
 *   while (!host.take_result(res)) host.poll(now_ms());
 *   // res.error, res.response
 * }
 * @endcode
 */
#ifndef HF2_HOST_HPP
#define HF2_HOST_HPP

#include <stdint.h>
#include <stddef.h>
#include "protocol.hpp"
#include "message.hpp"
#include "command.hpp"
#include "reassembler.hpp"
#include "correlator.hpp"
#include "serial_demux.hpp"
#include "diagnostics.hpp"
#include "transport/transport_base.hpp"

namespace hf2 {

class Host {
public:
  /// Upper bound on reports consumed by one poll(), so a chatty device cannot
  /// starve the deadline check. When the cap cuts a command message short the
  /// deadline check waits for the next poll().
  static constexpr size_t REPORTS_PER_POLL = 8;

  using CompletionFn = Correlator::CompletionFn;

  /**
   * @param transport        Report link to the device; must outlive the Host.
   * @param timeout_ms       Response deadline per request.
   * @param max_message_size Largest message either side accepts.
   */
  explicit Host(transport::ITransport& transport,
                uint32_t timeout_ms = DEFAULT_TIMEOUT_MS,
                size_t max_message_size = MAX_MESSAGE_SIZE);

  /**
   * @brief Send a command and start awaiting its reply.
   *
   * `command.tag` is overwritten with the assigned tag.
   *
   * @return Error::Ok, Error::AlreadyAwaiting, a codec error
   *         (UnknownCommand, MessageTooLarge), or Error::TransportError.
   */
  Error issue(Command& command, uint32_t now_ms);

  /// Convenience form; writes the assigned tag to `tag_out` when given.
  Error issue(CommandId id, const CommandArgs& args, uint32_t now_ms, uint16_t* tag_out = nullptr);

  /// Process one incoming report (callback-driven transports).
  void feed_report(const uint8_t* report, size_t len);

  /// Drain pending reports from the transport and check the deadline.
  void poll(uint32_t now_ms);

  /// Cancel the outstanding request; NotAwaiting if nothing is outstanding.
  Error cancel() { return corr_.cancel(); }

  bool take_result(Result& out) { return corr_.take_result(out); }
  bool busy() const             { return corr_.awaiting(); }

  void set_completion_callback(CompletionFn fn, void* user) { corr_.set_completion_callback(fn, user); }
  void set_serial_sink(Channel channel, SerialDemux::Sink fn, void* user) { demux_.set_sink(channel, fn, user); }
  void set_timeout_ms(uint32_t ms) { corr_.set_timeout_ms(ms); }

  Diagnostics&       diagnostics()      { return diag_; }
  Correlator&        correlator()       { return corr_; }
  const SerialDemux& serial() const     { return demux_; }
  size_t             max_message_size() const { return max_; }

  uint32_t reports_in() const  { return reports_in_; }
  uint32_t reports_out() const { return reports_out_; }

private:
  void  handle_message(const Message& msg);
  Error send_packets(const ByteBuffer& bytes);

  transport::ITransport& transport_;
  size_t       max_;
  Diagnostics  diag_;
  Reassembler  reasm_;
  Correlator   corr_;
  SerialDemux  demux_;

  ByteBuffer   tx_;                    ///< Encoded outgoing command
  Message      rx_;                    ///< Last reassembled message
  Command      scratch_;               ///< Backing store for issue(id, args)

  uint32_t     reports_in_{0};
  uint32_t     reports_out_{0};
};

} // namespace hf2

#endif // HF2_HOST_HPP

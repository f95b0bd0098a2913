/**
 * @file device.hpp
 * @brief hf2 Device — the device-side link driver: decode commands, run the handler, reply.
 *
 * @details
 * The device role mirrors `Host` with the same building blocks and no
 * correlator: every well-formed command gets exactly one reply carrying the
 * command's tag, and the firmware can push stdout/stderr text at any time.
 *
 * ```
 *   transport ─► feed_report() ─► Reassembler ─► decode_command ─► CommandHandler::handle
 *                                                                        │
 *   transport ◄─ Fragmenter ◄─ encode_response ◄─────────────────────────┘
 *
 *   write_stdout()/write_stderr() ─► Fragmenter (serial kind) ─► transport
 * ```
 *
 * Input the handler never sees:
 * - **Unknown command id**: answered with `NotRecognized`.
 * - **Known id, malformed arguments**: answered with `ExecutionError`,
 *   `status_info` = the `hf2::Error` code.
 * - **Too short to carry a tag**: dropped and logged; there is nobody to
 *   answer.
 *
 * The handler fills in status and data; the device forces the reply tag to
 * the command's tag. A reply the codec refuses (data variant of the wrong
 * layout, too large) is replaced with `ExecutionError`.
 */
#ifndef HF2_DEVICE_HPP
#define HF2_DEVICE_HPP

#include <stdint.h>
#include <stddef.h>
#include "protocol.hpp"
#include "message.hpp"
#include "command.hpp"
#include "reassembler.hpp"
#include "diagnostics.hpp"
#include "transport/transport_base.hpp"

namespace hf2 {

/**
 * @brief Device-specific command implementation (flash, reset, info).
 *
 * `response` arrives pre-filled as an empty Ok reply for the command's tag.
 * Commands the firmware does not implement should set
 * `ResponseStatus::NotRecognized`.
 */
class CommandHandler {
public:
  virtual ~CommandHandler() = default;
  virtual void handle(const Command& command, Response& response) = 0;
};

class Device {
public:
  static constexpr size_t REPORTS_PER_POLL = 8;

  Device(transport::ITransport& transport, CommandHandler& handler,
         size_t max_message_size = MAX_MESSAGE_SIZE);

  /// Process one incoming report (callback-driven transports, USB ISR hand-off).
  void feed_report(const uint8_t* report, size_t len);

  /// Drain pending reports from the transport.
  void poll();

  /// Push diagnostic output to the host. MessageTooLarge / TransportError on failure.
  Error write_stdout(const uint8_t* data, size_t len) { return send_message(Channel::Stdout, data, len); }
  Error write_stderr(const uint8_t* data, size_t len) { return send_message(Channel::Stderr, data, len); }

  /// Null-terminated text convenience.
  Error print(const char* text);

  Diagnostics& diagnostics()            { return diag_; }
  uint32_t     commands_handled() const { return handled_; }
  uint32_t     commands_rejected() const { return rejected_; }

private:
  void  handle_message(const Message& msg);
  void  reply(const Response& resp, CommandId request_id);
  Error send_message(Channel channel, const uint8_t* data, size_t len);

  transport::ITransport& transport_;
  CommandHandler& handler_;
  size_t       max_;
  Diagnostics  diag_;
  Reassembler  reasm_;

  Message      rx_;
  Command      cmd_;
  Response     resp_;
  ByteBuffer   tx_;

  uint32_t     handled_{0};
  uint32_t     rejected_{0};
};

} // namespace hf2

#endif // HF2_DEVICE_HPP

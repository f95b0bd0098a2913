#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal HID report transport interface for hf2 Host and Device.
 *
 * Header-only on purpose for easy embedding. No STL in the embedded path.
 */

#include <cstddef>
#include <cstdint>
#include "hf2/protocol.hpp"

namespace hf2::transport {

// Return codes kept simple for embedded sanity.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

/**
 * @brief Report-oriented transport every driver can rely on.
 *
 * Contract:
 *  - send_report(buf,len) transmits exactly one report of report_size() bytes.
 *    Report numbering (the leading 0 byte hidraw wants) is the driver's business.
 *  - recv_report(buf,cap,len) pulls one report if one is ready; never blocks.
 *    RxResult::None means nothing pending.
 *  - Reports arrive in the order they were sent. No retries happen below us.
 *  - name() is a short identifier for logs/diagnostics.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual TxResult    send_report(const uint8_t* report, std::size_t len) = 0;
  virtual RxResult    recv_report(uint8_t* out, std::size_t cap, std::size_t& out_len) = 0;
  virtual const char* name() const = 0;
  virtual std::size_t report_size() const { return PACKET_SIZE; }
};

} // namespace hf2::transport

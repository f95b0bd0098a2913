// -----------------------------------------------------------------------------
// packet.cpp — header coding and report parsing for hf2::Packet
//
// API & byte layout:
//   see include/hf2/packet.hpp
//
// Usage tests:
//   see tests/test_packet.cpp and tests/test-packet/
// -----------------------------------------------------------------------------
#include "hf2/packet.hpp"

#include <string.h>

namespace hf2 {

Error decode_header(uint8_t header, PacketKind& kind, uint8_t& length, size_t capacity) {
  const PacketKind k = static_cast<PacketKind>(header & HEADER_KIND_MASK); // top 2 bits
  const uint8_t    n = header & HEADER_LENGTH_MASK;                        // low 6 bits

  if (capacity == 0 || n > capacity - 1) return Error::LengthOverflow;     // cannot fit the report
  if (k == PacketKind::CommandMore && n == 0) return Error::MalformedHeader; // inner fragment must carry bytes

  kind = k;
  length = n;
  return Error::Ok;
}

Error encode_header(PacketKind kind, size_t length, uint8_t& out) {
  if (length > PACKET_PAYLOAD_MAX) return Error::LengthOverflow;
  out = static_cast<uint8_t>(static_cast<uint8_t>(kind) | static_cast<uint8_t>(length));
  return Error::Ok;
}

Packet::Packet() {
  memset(bytes, 0, sizeof(bytes));
  bytes[0] = static_cast<uint8_t>(PacketKind::CommandFinal);
}

Error Packet::build(PacketKind kind, const uint8_t* payload, size_t len, Packet& out) {
  uint8_t header = 0;
  const Error err = encode_header(kind, len, header);
  if (err != Error::Ok) return err;
  if (len > 0 && !payload) return Error::LengthOverflow;   // claimed bytes we cannot read

  memset(out.bytes, 0, sizeof(out.bytes));                 // zero padding past payload
  out.bytes[0] = header;
  if (len > 0) memcpy(out.bytes + 1, payload, len);
  return Error::Ok;
}

Error Packet::parse(const uint8_t* report, size_t len, Packet& out) {
  if (!report || len == 0 || len > PACKET_SIZE) return Error::LengthOverflow;

  PacketKind kind;
  uint8_t n = 0;
  const Error err = decode_header(report[0], kind, n, len);  // length checked against what arrived
  if (err != Error::Ok) return err;

  memset(out.bytes, 0, sizeof(out.bytes));
  out.bytes[0] = report[0];
  memcpy(out.bytes + 1, report + 1, n);                      // padding is not carried over
  return Error::Ok;
}

} // namespace hf2

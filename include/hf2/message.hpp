/**
 * @file message.hpp
 * @brief hf2 Message — one logical message: channel + reassembled bytes.
 *
 * A `Message` is what the reassembler yields and what the fragmenter consumes:
 *
 *  - `channel` : command stream (request/response) or one of the serial channels.
 *  - `data`    : the message bytes, 0..MAX_MESSAGE_SIZE, in a fixed-capacity
 *                ETL vector. No heap, safe on MCUs.
 *
 * Runtime limits smaller than the compile-time capacity are enforced by the
 * reassembler and fragmenter, not by this container.
 */
#pragma once

#include <stdint.h>
#include <stddef.h>
#include "etl/vector.h"
#include "protocol.hpp"

namespace hf2 {

/// Fixed-capacity byte buffer sized for the largest logical message.
using ByteBuffer = etl::vector<uint8_t, MAX_MESSAGE_SIZE>;

struct Message {
  Channel    channel{Channel::Command};  ///< Where the bytes travel
  ByteBuffer data;                       ///< Message bytes

  Message() = default;

  Message(Channel ch, const uint8_t* bytes, size_t len) : channel(ch) {
    assign(bytes, len);
  }

  /// Replace contents; returns false (and leaves data empty) if `len` exceeds capacity.
  bool assign(const uint8_t* bytes, size_t len) {
    data.clear();
    if (len > data.max_size()) return false;
    if (len > 0) data.assign(bytes, bytes + len);
    return true;
  }

  bool     is_serial() const { return hf2::is_serial(channel); }
  size_t   size() const      { return data.size(); }
  bool     empty() const     { return data.empty(); }
  const uint8_t* bytes() const { return data.data(); }
};

} // namespace hf2

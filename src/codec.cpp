// -----------------------------------------------------------------------------
// codec.cpp — command/response wire encoding
//
// API & error table:
//   see include/hf2/codec.hpp
//
// Usage tests:
//   see tests/test_codec.cpp
//
// Notes for maintainers:
// - Every encoder computes the final size before writing a single byte, so a
//   fixed-capacity ByteBuffer is never pushed past its end.
// - Decoders check length before every read; `rest` always counts the bytes
//   after the 4-byte header.
// -----------------------------------------------------------------------------
#include "hf2/codec.hpp"

namespace hf2 {

// ---------- local helpers ----------

// Does the argument alternative match the table's layout for this id?
static bool args_match(const CommandArgs& a, ArgLayout layout) {
  switch (layout) {
    case ArgLayout::None:      return etl::holds_alternative<args::None>(a);
    case ArgLayout::FlashPage: return etl::holds_alternative<args::FlashPage>(a);
    case ArgLayout::Range:     return etl::holds_alternative<args::Range>(a);
    case ArgLayout::Words:     return etl::holds_alternative<args::Words>(a);
  }
  return false;
}

static bool data_matches(const ResponseData& d, ResultLayout layout) {
  switch (layout) {
    case ResultLayout::Empty:     return etl::holds_alternative<results::None>(d);
    case ResultLayout::BinInfo:   return etl::holds_alternative<results::BinInfo>(d);
    case ResultLayout::Text:      return etl::holds_alternative<results::Text>(d);
    case ResultLayout::Checksums: return etl::holds_alternative<results::Checksums>(d);
    case ResultLayout::Words:     return etl::holds_alternative<results::Words>(d);
  }
  return false;
}

static bool valid_status(uint8_t s) {
  return s <= static_cast<uint8_t>(ResponseStatus::ExecutionError);
}

// ---------- commands ----------

Error encode_command(const Command& cmd, ByteBuffer& out) {
  out.clear();

  if (!is_known_command(static_cast<uint16_t>(cmd.id))) return Error::UnknownCommand;
  const ArgLayout layout = arg_layout(cmd.id);
  if (!args_match(cmd.args, layout)) return Error::UnknownCommand;

  // size first
  size_t need = COMMAND_HEADER_SIZE;
  switch (layout) {
    case ArgLayout::None:      break;
    case ArgLayout::FlashPage: need += 4 + etl::get<args::FlashPage>(cmd.args).data.size(); break;
    case ArgLayout::Range:     need += 8; break;
    case ArgLayout::Words:     need += 8 + 4 * etl::get<args::Words>(cmd.args).words.size(); break;
  }
  if (need > out.max_size()) return Error::MessageTooLarge;

  put_u16(out, static_cast<uint16_t>(cmd.id));
  put_u16(out, cmd.tag);

  switch (layout) {
    case ArgLayout::None:
      break;
    case ArgLayout::FlashPage: {
      const args::FlashPage& a = etl::get<args::FlashPage>(cmd.args);
      put_u32(out, a.target_addr);
      out.insert(out.end(), a.data.begin(), a.data.end());
      break;
    }
    case ArgLayout::Range: {
      const args::Range& a = etl::get<args::Range>(cmd.args);
      put_u32(out, a.target_addr);
      put_u32(out, a.count);
      break;
    }
    case ArgLayout::Words: {
      const args::Words& a = etl::get<args::Words>(cmd.args);
      put_u32(out, a.target_addr);
      put_u32(out, static_cast<uint32_t>(a.words.size()));   // count is derived, never stored
      for (size_t i = 0; i < a.words.size(); ++i) put_u32(out, a.words[i]);
      break;
    }
  }
  return Error::Ok;
}

Error peek_command_header(const uint8_t* data, size_t len, uint16_t& raw_id, uint16_t& tag) {
  if (!data || len < COMMAND_HEADER_SIZE) return Error::TruncatedMessage;
  raw_id = get_u16(data);
  tag    = get_u16(data + 2);
  return Error::Ok;
}

Error decode_command(const uint8_t* data, size_t len, Command& out) {
  if (len > MAX_MESSAGE_SIZE) return Error::MessageTooLarge;

  uint16_t raw_id = 0;
  uint16_t tag = 0;
  const Error hdr = peek_command_header(data, len, raw_id, tag);
  if (hdr != Error::Ok) return hdr;

  out.tag = tag;                                     // tag survives so callers can still reply
  if (!is_known_command(raw_id)) return Error::UnsupportedCommand;
  out.id = static_cast<CommandId>(raw_id);

  const uint8_t* p = data + COMMAND_HEADER_SIZE;
  const size_t rest = len - COMMAND_HEADER_SIZE;

  switch (arg_layout(out.id)) {
    case ArgLayout::None:
      if (rest != 0) return Error::PayloadLengthMismatch;
      out.args.emplace<args::None>();
      return Error::Ok;

    case ArgLayout::FlashPage: {
      if (rest < 4) return Error::TruncatedMessage;
      args::FlashPage& a = out.args.emplace<args::FlashPage>();
      a.target_addr = get_u32(p);
      a.data.assign(p + 4, p + rest);                // page data is the rest of the message
      return Error::Ok;
    }

    case ArgLayout::Range: {
      if (rest < 8) return Error::TruncatedMessage;
      if (rest > 8) return Error::PayloadLengthMismatch;
      args::Range& a = out.args.emplace<args::Range>();
      a.target_addr = get_u32(p);
      a.count       = get_u32(p + 4);
      return Error::Ok;
    }

    case ArgLayout::Words: {
      if (rest < 8) return Error::TruncatedMessage;
      const uint32_t n = get_u32(p + 4);
      if (static_cast<uint64_t>(n) * 4 != rest - 8) return Error::PayloadLengthMismatch;
      args::Words& a = out.args.emplace<args::Words>();
      a.target_addr = get_u32(p);
      for (uint32_t i = 0; i < n; ++i) a.words.push_back(get_u32(p + 8 + 4 * i));
      return Error::Ok;
    }
  }
  return Error::UnsupportedCommand;
}

// ---------- responses ----------

Error encode_response(const Response& resp, CommandId request_id, ByteBuffer& out) {
  out.clear();

  if (!valid_status(static_cast<uint8_t>(resp.status))) return Error::UnknownStatus;

  // Failure replies carry no payload, so they can answer ids outside the table.
  const bool ok = (resp.status == ResponseStatus::Ok);
  if (ok && !is_known_command(static_cast<uint16_t>(request_id))) return Error::UnknownCommand;
  const ResultLayout layout = ok ? result_layout(request_id) : ResultLayout::Empty;
  if (ok && !data_matches(resp.data, layout)) return Error::UnknownCommand;

  size_t need = RESPONSE_HEADER_SIZE;
  switch (layout) {
    case ResultLayout::Empty:     break;
    case ResultLayout::BinInfo:   need += etl::get<results::BinInfo>(resp.data).has_family_id ? 20 : 16; break;
    case ResultLayout::Text:      need += etl::get<results::Text>(resp.data).text.size(); break;
    case ResultLayout::Checksums: need += 2 * etl::get<results::Checksums>(resp.data).values.size(); break;
    case ResultLayout::Words:     need += 4 * etl::get<results::Words>(resp.data).values.size(); break;
  }
  if (need > out.max_size()) return Error::MessageTooLarge;

  put_u16(out, resp.tag);
  out.push_back(static_cast<uint8_t>(resp.status));
  out.push_back(resp.status_info);

  switch (layout) {
    case ResultLayout::Empty:
      break;
    case ResultLayout::BinInfo: {
      const results::BinInfo& b = etl::get<results::BinInfo>(resp.data);
      put_u32(out, b.mode);
      put_u32(out, b.flash_page_size);
      put_u32(out, b.flash_num_pages);
      put_u32(out, b.max_message_size);
      if (b.has_family_id) put_u32(out, b.family_id);
      break;
    }
    case ResultLayout::Text: {
      const results::Text& t = etl::get<results::Text>(resp.data);
      for (size_t i = 0; i < t.text.size(); ++i) out.push_back(static_cast<uint8_t>(t.text[i]));
      break;
    }
    case ResultLayout::Checksums: {
      const results::Checksums& c = etl::get<results::Checksums>(resp.data);
      for (size_t i = 0; i < c.values.size(); ++i) put_u16(out, c.values[i]);
      break;
    }
    case ResultLayout::Words: {
      const results::Words& w = etl::get<results::Words>(resp.data);
      for (size_t i = 0; i < w.values.size(); ++i) put_u32(out, w.values[i]);
      break;
    }
  }
  return Error::Ok;
}

Error peek_response_tag(const uint8_t* data, size_t len, uint16_t& tag) {
  if (!data || len < RESPONSE_HEADER_SIZE) return Error::TruncatedMessage;
  tag = get_u16(data);
  return Error::Ok;
}

Error decode_response(const uint8_t* data, size_t len, CommandId request_id, Response& out) {
  if (len > MAX_MESSAGE_SIZE) return Error::MessageTooLarge;

  uint16_t tag = 0;
  const Error hdr = peek_response_tag(data, len, tag);
  if (hdr != Error::Ok) return hdr;

  out.tag = tag;
  out.data.emplace<results::None>();
  if (!valid_status(data[2])) return Error::UnknownStatus;
  out.status      = static_cast<ResponseStatus>(data[2]);
  out.status_info = data[3];

  if (!is_known_command(static_cast<uint16_t>(request_id))) return Error::UnsupportedCommand;
  if (out.status != ResponseStatus::Ok) return Error::Ok;   // failure payload is opaque

  const uint8_t* p = data + RESPONSE_HEADER_SIZE;
  const size_t rest = len - RESPONSE_HEADER_SIZE;

  switch (result_layout(request_id)) {
    case ResultLayout::Empty:
      if (rest != 0) return Error::PayloadLengthMismatch;
      return Error::Ok;

    case ResultLayout::BinInfo: {
      if (rest < 16) return Error::TruncatedMessage;
      if (rest != 16 && rest != 20) return Error::PayloadLengthMismatch;
      results::BinInfo& b = out.data.emplace<results::BinInfo>();
      b.mode             = get_u32(p);
      b.flash_page_size  = get_u32(p + 4);
      b.flash_num_pages  = get_u32(p + 8);
      b.max_message_size = get_u32(p + 12);
      b.has_family_id    = (rest == 20);
      b.family_id        = b.has_family_id ? get_u32(p + 16) : 0;
      return Error::Ok;
    }

    case ResultLayout::Text: {
      results::Text& t = out.data.emplace<results::Text>();
      t.text.assign(reinterpret_cast<const char*>(p), rest);
      return Error::Ok;
    }

    case ResultLayout::Checksums: {
      if (rest % 2 != 0) return Error::PayloadLengthMismatch;
      results::Checksums& c = out.data.emplace<results::Checksums>();
      for (size_t i = 0; i < rest; i += 2) c.values.push_back(get_u16(p + i));
      return Error::Ok;
    }

    case ResultLayout::Words: {
      if (rest % 4 != 0) return Error::PayloadLengthMismatch;
      results::Words& w = out.data.emplace<results::Words>();
      for (size_t i = 0; i < rest; i += 4) w.values.push_back(get_u32(p + i));
      return Error::Ok;
    }
  }
  return Error::UnsupportedCommand;
}

Error decode_response(const uint8_t* data, size_t len, const Command& request, Response& out) {
  const Error err = decode_response(data, len, request.id, out);
  if (err != Error::Ok || out.status != ResponseStatus::Ok) return err;

  // element count implied by the request
  const args::Range* range = etl::get_if<args::Range>(&request.args);
  if (!range) return Error::Ok;

  if (const results::Checksums* c = etl::get_if<results::Checksums>(&out.data)) {
    if (c->values.size() != range->count) return Error::PayloadLengthMismatch;
  }
  if (const results::Words* w = etl::get_if<results::Words>(&out.data)) {
    if (w->values.size() != range->count) return Error::PayloadLengthMismatch;
  }
  return Error::Ok;
}

} // namespace hf2

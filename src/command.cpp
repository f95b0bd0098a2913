// -----------------------------------------------------------------------------
// command.cpp — command table lookups and request builders
//
// API & command table:
//   see include/hf2/command.hpp
//
// Notes for maintainers:
// - The switch statements below ARE the command table. A new command needs
//   an entry in every one of them plus a CommandId value.
// - Builders never fail; oversize inputs are truncated to buffer capacity and
//   the codec then rejects the message as too large on encode.
// -----------------------------------------------------------------------------
#include "hf2/command.hpp"

namespace hf2 {

bool is_known_command(uint16_t raw_id) {
  switch (static_cast<CommandId>(raw_id)) {
    case CommandId::BinInfo:
    case CommandId::Info:
    case CommandId::ResetIntoApp:
    case CommandId::ResetIntoBootloader:
    case CommandId::StartFlash:
    case CommandId::WriteFlashPage:
    case CommandId::ChecksumPages:
    case CommandId::ReadWords:
    case CommandId::WriteWords:
    case CommandId::Dmesg:
      return true;
  }
  return false;
}

ArgLayout arg_layout(CommandId id) {
  switch (id) {
    case CommandId::WriteFlashPage: return ArgLayout::FlashPage;
    case CommandId::ChecksumPages:
    case CommandId::ReadWords:      return ArgLayout::Range;
    case CommandId::WriteWords:     return ArgLayout::Words;
    default:                        return ArgLayout::None;
  }
}

ResultLayout result_layout(CommandId id) {
  switch (id) {
    case CommandId::BinInfo:       return ResultLayout::BinInfo;
    case CommandId::Info:
    case CommandId::Dmesg:         return ResultLayout::Text;
    case CommandId::ChecksumPages: return ResultLayout::Checksums;
    case CommandId::ReadWords:     return ResultLayout::Words;
    default:                       return ResultLayout::Empty;
  }
}

const char* command_name(CommandId id) {
  switch (id) {
    case CommandId::BinInfo:             return "bin_info";
    case CommandId::Info:                return "info";
    case CommandId::ResetIntoApp:        return "reset_into_app";
    case CommandId::ResetIntoBootloader: return "reset_into_bootloader";
    case CommandId::StartFlash:          return "start_flash";
    case CommandId::WriteFlashPage:      return "write_flash_page";
    case CommandId::ChecksumPages:       return "checksum_pages";
    case CommandId::ReadWords:           return "read_words";
    case CommandId::WriteWords:          return "write_words";
    case CommandId::Dmesg:               return "dmesg";
  }
  return "unknown";
}

const char* status_name(ResponseStatus s) {
  switch (s) {
    case ResponseStatus::Ok:             return "ok";
    case ResponseStatus::NotRecognized:  return "not_recognized";
    case ResponseStatus::ExecutionError: return "execution_error";
  }
  return "unknown";
}

// ---------- builders ----------

static Command make_plain(CommandId id) {
  Command c;
  c.id = id;
  c.args.emplace<args::None>();
  return c;
}

Command make_bin_info()              { return make_plain(CommandId::BinInfo); }
Command make_info()                  { return make_plain(CommandId::Info); }
Command make_dmesg()                 { return make_plain(CommandId::Dmesg); }
Command make_reset_into_app()        { return make_plain(CommandId::ResetIntoApp); }
Command make_reset_into_bootloader() { return make_plain(CommandId::ResetIntoBootloader); }
Command make_start_flash()           { return make_plain(CommandId::StartFlash); }

Command make_write_flash_page(uint32_t addr, const uint8_t* data, size_t len) {
  Command c;
  c.id = CommandId::WriteFlashPage;
  args::FlashPage& a = c.args.emplace<args::FlashPage>();
  a.target_addr = addr;
  for (size_t i = 0; i < len && !a.data.full(); ++i) {
    a.data.push_back(data[i]);
  }
  return c;
}

Command make_checksum_pages(uint32_t addr, uint32_t num_pages) {
  Command c;
  c.id = CommandId::ChecksumPages;
  args::Range& a = c.args.emplace<args::Range>();
  a.target_addr = addr;
  a.count = num_pages;
  return c;
}

Command make_read_words(uint32_t addr, uint32_t num_words) {
  Command c;
  c.id = CommandId::ReadWords;
  args::Range& a = c.args.emplace<args::Range>();
  a.target_addr = addr;
  a.count = num_words;
  return c;
}

Command make_write_words(uint32_t addr, const uint32_t* words, size_t count) {
  Command c;
  c.id = CommandId::WriteWords;
  args::Words& a = c.args.emplace<args::Words>();
  a.target_addr = addr;
  for (size_t i = 0; i < count && !a.words.full(); ++i) {
    a.words.push_back(words[i]);
  }
  return c;
}

Response make_ok(uint16_t tag) {
  Response r;
  r.tag = tag;
  r.status = ResponseStatus::Ok;
  r.status_info = 0;
  r.data.emplace<results::None>();
  return r;
}

Response make_error(uint16_t tag, ResponseStatus status, uint8_t status_info) {
  Response r;
  r.tag = tag;
  r.status = status;
  r.status_info = status_info;
  r.data.emplace<results::None>();
  return r;
}

} // namespace hf2

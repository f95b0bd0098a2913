/**
 * @file command.hpp
 * @brief hf2 command/response vocabulary: ids, statuses, argument and result variants.
 *
 * @details
 * PURPOSE
 * -------
 * This is the contract between a host and an hf2 device. Every request the
 * host can make is a `CommandId` with a fixed argument layout; every reply
 * the device sends is a `Response` whose payload layout is fixed by the id
 * of the request it answers.
 *
 * Both are modelled as closed tagged variants (`etl::variant`), so a decoded
 * command or response is always exactly one of the layouts below and
 * carries no heap storage.
 *
 * COMMAND TABLE
 * -------------
 * | id     | name                | args                                  | Ok payload                      |
 * |--------|---------------------|---------------------------------------|---------------------------------|
 * | 0x0001 | BinInfo             | none                                  | mode, page size, pages, max msg[, family] |
 * | 0x0002 | Info                | none                                  | text                            |
 * | 0x0003 | ResetIntoApp        | none                                  | empty                           |
 * | 0x0004 | ResetIntoBootloader | none                                  | empty                           |
 * | 0x0005 | StartFlash          | none                                  | empty                           |
 * | 0x0006 | WriteFlashPage      | u32 addr, data[rest]                  | empty                           |
 * | 0x0007 | ChecksumPages       | u32 addr, u32 num_pages               | u16 checksum[num_pages]         |
 * | 0x0008 | ReadWords           | u32 addr, u32 num_words               | u32 word[num_words]             |
 * | 0x0009 | WriteWords          | u32 addr, u32 num_words, u32 word[n]  | empty                           |
 * | 0x0010 | Dmesg               | none                                  | text                            |
 *
 * Ids are part of the wire contract: layouts never change, new commands get
 * new ids.
 *
 * EXAMPLE FLOW
 * ------------
 *   Request:  make_read_words(0x20000000, 4) → tag assigned by the Correlator
 *   Wire:     [08 00][tag lo tag hi][00 00 00 20][04 00 00 00]
 *   Device:   [tag lo tag hi][00][00][16 bytes of words]
 *   Host:     Response{status=Ok, data=results::Words{4 values}}
 */
#ifndef HF2_COMMAND_HPP
#define HF2_COMMAND_HPP

#include <stdint.h>
#include <stddef.h>
#include "etl/vector.h"
#include "etl/string.h"
#include "etl/variant.h"
#include "protocol.hpp"
#include "message.hpp"

namespace hf2 {

// =============================== Ids ===============================

enum class CommandId : uint16_t {
  BinInfo             = 0x0001,  ///< Mode and flash geometry
  Info                = 0x0002,  ///< Free-form device description
  ResetIntoApp        = 0x0003,
  ResetIntoBootloader = 0x0004,
  StartFlash          = 0x0005,  ///< Enter flashing mode
  WriteFlashPage      = 0x0006,
  ChecksumPages       = 0x0007,  ///< CRC16 per flash page
  ReadWords           = 0x0008,
  WriteWords          = 0x0009,
  Dmesg               = 0x0010   ///< Device log buffer
};

enum class ResponseStatus : uint8_t {
  Ok             = 0x00,
  NotRecognized  = 0x01,  ///< Device does not implement the command
  ExecutionError = 0x02   ///< Command understood but failed; see status_info
};

/// BinInfo `mode` values.
enum : uint32_t {
  BININFO_MODE_BOOTLOADER = 0x0001,
  BININFO_MODE_USER       = 0x0002
};

// ============================ Buffers ==============================

using WordBuffer     = etl::vector<uint32_t, MAX_MESSAGE_SIZE / 4>;
using ChecksumBuffer = etl::vector<uint16_t, MAX_MESSAGE_SIZE / 2>;
using TextBuffer     = etl::string<MAX_MESSAGE_SIZE>;

// ============================ Arguments ============================

namespace args {

struct None {};

/// WriteFlashPage
struct FlashPage {
  uint32_t   target_addr{0};
  ByteBuffer data;
};

/// ChecksumPages (count = pages) and ReadWords (count = words)
struct Range {
  uint32_t target_addr{0};
  uint32_t count{0};
};

/// WriteWords
struct Words {
  uint32_t   target_addr{0};
  WordBuffer words;
};

} // namespace args

using CommandArgs = etl::variant<args::None, args::FlashPage, args::Range, args::Words>;

struct Command {
  CommandId   id{CommandId::BinInfo};
  uint16_t    tag{0};                ///< Assigned by the Correlator on send
  CommandArgs args;
};

// ============================= Results =============================

namespace results {

struct None {};

struct BinInfo {
  uint32_t mode{0};
  uint32_t flash_page_size{0};
  uint32_t flash_num_pages{0};
  uint32_t max_message_size{0};
  uint32_t family_id{0};
  bool     has_family_id{false};     ///< Older bootloaders stop after max_message_size
};

/// Info and Dmesg
struct Text {
  TextBuffer text;
};

/// ChecksumPages
struct Checksums {
  ChecksumBuffer values;
};

/// ReadWords
struct Words {
  WordBuffer values;
};

} // namespace results

using ResponseData = etl::variant<results::None, results::BinInfo, results::Text,
                                  results::Checksums, results::Words>;

struct Response {
  uint16_t       tag{0};
  ResponseStatus status{ResponseStatus::Ok};
  uint8_t        status_info{0};
  ResponseData   data;               ///< results::None unless status is Ok
};

// ============================ Vocabulary ===========================

/// Argument layout a command id uses.
enum class ArgLayout : uint8_t { None, FlashPage, Range, Words };

/// Payload layout an Ok response to a command id uses.
enum class ResultLayout : uint8_t { Empty, BinInfo, Text, Checksums, Words };

/// True when `raw_id` names an entry of the command table.
bool is_known_command(uint16_t raw_id);

ArgLayout    arg_layout(CommandId id);
ResultLayout result_layout(CommandId id);

/// Short command name ("bin_info", "read_words"); "unknown" outside the table.
const char* command_name(CommandId id);
const char* status_name(ResponseStatus s);

// ============================= Builders ============================
// Tags are left at 0; the Correlator stamps them on send.

Command make_bin_info();
Command make_info();
Command make_dmesg();
Command make_reset_into_app();
Command make_reset_into_bootloader();
Command make_start_flash();
Command make_write_flash_page(uint32_t addr, const uint8_t* data, size_t len);
Command make_checksum_pages(uint32_t addr, uint32_t num_pages);
Command make_read_words(uint32_t addr, uint32_t num_words);
Command make_write_words(uint32_t addr, const uint32_t* words, size_t count);

/// Ok response with no payload data.
Response make_ok(uint16_t tag);

/// Failure response (NotRecognized / ExecutionError) with no payload data.
Response make_error(uint16_t tag, ResponseStatus status, uint8_t status_info = 0);

} // namespace hf2

#endif // HF2_COMMAND_HPP

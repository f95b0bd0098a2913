#pragma once
/**
 * @file command_dispatch.hpp
 * @brief Centralized resolution of CLI command names + string arguments → hf2::Command.
 *
 * @details
 * PURPOSE
 * -------
 * The dispatcher is the glue between `hf2-cli` option strings and the
 * typed builders in hf2/command.hpp. It exists so that:
 *   - `cli/main.cpp` never has to know about individual builders.
 *   - Parsing, validation, and command selection are kept in one place.
 *   - A new command is added by editing only this file + command.cpp.
 *
 * WHAT THIS DOES
 * --------------
 * - `name_to_id()` maps user-facing names (`"bininfo"`, `"read-words"`,
 *   `"reset_bootloader"`...) onto a `CommandId`. Case, `-` and `_` are
 *   normalized; a few short synonyms are accepted.
 * - `build_command_from_id()` parses the positional string arguments a
 *   command needs (addresses, counts, words, hex page data) and calls the
 *   matching builder. Numbers accept decimal, `0x` hex and `0` octal.
 * - `build_command()` does both.
 *
 * Failures come back as `false` plus a short machine-friendly reason in
 * `err`, ready for `status=error reason=<err>`:
 *   - `unknown_command:<name>`
 *   - `missing_arg:<what>` / `extra_args`
 *   - `bad_value:<what>`
 *
 * EXAMPLE
 * -------
 *   hf2::Command cmd;
 *   std::string err;
 *   if (!hf2::build_command("read-words", {"0x20000000", "4"}, cmd, err)) {
 *       std::cerr << "status=error reason=" << err << "\n";
 *       return 2;
 *   }
 */

#include <cstdint>
#include <string>
#include <vector>

#include "hf2/command.hpp"

namespace hf2 {

/// Resolve a CLI name into a command id. False for unknown names.
bool name_to_id(const std::string& name, CommandId& out_id);

/// Build a command from its id and positional string arguments.
bool build_command_from_id(CommandId id, const std::vector<std::string>& args,
                           Command& out, std::string& err);

/// name_to_id() + build_command_from_id().
bool build_command(const std::string& name, const std::vector<std::string>& args,
                   Command& out, std::string& err);

/// Usage hint for a command's arguments ("<addr> <num_words>").
const char* command_usage(CommandId id);

} // namespace hf2

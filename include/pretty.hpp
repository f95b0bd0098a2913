/**
 * @file pretty.hpp
 * @brief One-line key=value rendering of hf2 results and diagnostic events.
 *
 * @details
 * Everything `hf2-cli` prints goes through here, so output stays stable and
 * grep-friendly:
 *
 *   status=ok tag=1 cmd=bin_info mode=bootloader page_size=256 num_pages=1024 max_msg=1024
 *   status=ok tag=2 cmd=read_words count=2 words=0x20001000,0x00000a3d
 *   status=not_recognized tag=3 cmd=dmesg info=0
 *   status=error tag=4 cmd=info reason=timeout
 *   event=unexpected_tag channel=command tag=7 detail=8
 *
 * Text replies (Info, Dmesg) only report `len=<n>` on the summary line; the
 * caller prints the text itself, since it usually spans many lines.
 */
#pragma once

#include <string>
#include "hf2/correlator.hpp"
#include "hf2/diagnostics.hpp"

namespace hf2 {

std::string decode_pretty(const Result& result);
std::string event_pretty(const DiagnosticEvent& evt);

/// "bootloader", "user", or the raw number.
std::string bininfo_mode_name(uint32_t mode);

} // namespace hf2

// -----------------------------------------------------------------------------
// Implementation for command_dispatch.hpp
//
// This file provides the working guts of the hf2-cli command dispatcher.
// - See command_dispatch.hpp for API contracts and examples.
// - See tests/test_command_dispatch.cpp for runnable cases.
//
// Notes for maintainers:
// - Focus is on local parsing, validation, and switch-based dispatch.
// - No exceptions: every failure is `false` + a reason string.
// -----------------------------------------------------------------------------

#include "command_dispatch.hpp"

#include <cctype>                // character classification and case conversion
#include <cstdlib>               // strtoull for string→number parsing

namespace hf2 {

// ---------- local parsing helpers (no exceptions) ----------
// strtoull with base 0 accepts 123, 0x7B and 0173 alike.

static bool parse_u32(const std::string& s, uint32_t& out,
                      uint64_t lo=0, uint64_t hi=0xFFFFFFFFull) {
    if (s.empty() || s[0] == '-') return false;   // strtoull would wrap negatives
    char* e = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &e, 0);
    if (!e || *e) return false;                   // leftover junk
    if (v < lo || v > hi) return false;
    out = (uint32_t)v;
    return true;
}

static int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// "deadbeef" / "0xDEADBEEF" → bytes; even number of digits required
static bool parse_hex_bytes(const std::string& s, std::vector<uint8_t>& out) {
    size_t i = 0;
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) i = 2;
    if ((s.size() - i) % 2 != 0) return false;
    out.clear();
    for (; i < s.size(); i += 2) {
        const int hi = hex_nibble(s[i]);
        const int lo = hex_nibble(s[i + 1]);
        if (hi < 0 || lo < 0) return false;
        out.push_back((uint8_t)((hi << 4) | lo));
    }
    return true;
}

// lowercase + '_' → '-' so "Read_Words" and "read-words" match
static std::string normalize(std::string s) {
    for (auto& c : s) {
        c = (char)std::tolower((unsigned char)c);
        if (c == '_') c = '-';
    }
    return s;
}

// ---------- mapping: name -> CommandId ----------

bool name_to_id(const std::string& raw_name, CommandId& out_id) {
    const std::string name = normalize(raw_name);

    // Identity / inventory
    if (name == "bininfo" || name == "bin-info")             { out_id = CommandId::BinInfo; return true; }
    if (name == "info")                                      { out_id = CommandId::Info;    return true; }
    if (name == "dmesg" || name == "log")                    { out_id = CommandId::Dmesg;   return true; }

    // Resets
    if (name == "reset-app" || name == "reset-into-app")     { out_id = CommandId::ResetIntoApp;        return true; }
    if (name == "reset-bootloader" || name == "reset-into-bootloader" || name == "reset-bl") {
        out_id = CommandId::ResetIntoBootloader;
        return true;
    }

    // Flash / memory
    if (name == "start-flash")                               { out_id = CommandId::StartFlash;     return true; }
    if (name == "write-page" || name == "write-flash-page")  { out_id = CommandId::WriteFlashPage; return true; }
    if (name == "checksum" || name == "checksum-pages")      { out_id = CommandId::ChecksumPages;  return true; }
    if (name == "read-words" || name == "read")              { out_id = CommandId::ReadWords;      return true; }
    if (name == "write-words" || name == "write")            { out_id = CommandId::WriteWords;     return true; }

    return false;
}

const char* command_usage(CommandId id) {
    switch (id) {
        case CommandId::WriteFlashPage: return "<addr> <hex-data>";
        case CommandId::ChecksumPages:  return "<addr> <num_pages>";
        case CommandId::ReadWords:      return "<addr> <num_words>";
        case CommandId::WriteWords:     return "<addr> <word> [word...]";
        default:                        return "";
    }
}

// ---------- build from id ----------

bool build_command_from_id(CommandId id, const std::vector<std::string>& args,
                           Command& out, std::string& err) {
    switch (arg_layout(id)) {
        case ArgLayout::None: {
            if (!args.empty()) { err = "extra_args"; return false; }
            switch (id) {
                case CommandId::BinInfo:             out = make_bin_info(); break;
                case CommandId::Info:                out = make_info(); break;
                case CommandId::Dmesg:               out = make_dmesg(); break;
                case CommandId::ResetIntoApp:        out = make_reset_into_app(); break;
                case CommandId::ResetIntoBootloader: out = make_reset_into_bootloader(); break;
                case CommandId::StartFlash:          out = make_start_flash(); break;
                default: err = "unknown_command"; return false;
            }
            return true;
        }

        case ArgLayout::Range: {
            if (args.size() < 1) { err = "missing_arg:addr";  return false; }
            if (args.size() < 2) { err = "missing_arg:count"; return false; }
            if (args.size() > 2) { err = "extra_args";        return false; }
            uint32_t addr = 0, count = 0;
            if (!parse_u32(args[0], addr))  { err = "bad_value:addr";  return false; }
            if (!parse_u32(args[1], count)) { err = "bad_value:count"; return false; }
            out = (id == CommandId::ChecksumPages) ? make_checksum_pages(addr, count)
                                                   : make_read_words(addr, count);
            return true;
        }

        case ArgLayout::FlashPage: {
            if (args.size() < 1) { err = "missing_arg:addr"; return false; }
            if (args.size() < 2) { err = "missing_arg:data"; return false; }
            if (args.size() > 2) { err = "extra_args";       return false; }
            uint32_t addr = 0;
            std::vector<uint8_t> data;
            if (!parse_u32(args[0], addr))        { err = "bad_value:addr"; return false; }
            if (!parse_hex_bytes(args[1], data))  { err = "bad_value:data"; return false; }
            if (data.size() + 8 > MAX_MESSAGE_SIZE) { err = "bad_value:data_too_long"; return false; }
            out = make_write_flash_page(addr, data.data(), data.size());
            return true;
        }

        case ArgLayout::Words: {
            if (args.size() < 1) { err = "missing_arg:addr"; return false; }
            if (args.size() < 2) { err = "missing_arg:word"; return false; }
            uint32_t addr = 0;
            if (!parse_u32(args[0], addr)) { err = "bad_value:addr"; return false; }
            std::vector<uint32_t> words;
            for (size_t i = 1; i < args.size(); ++i) {
                uint32_t w = 0;
                if (!parse_u32(args[i], w)) { err = "bad_value:word"; return false; }
                words.push_back(w);
            }
            if (12 + 4 * words.size() > MAX_MESSAGE_SIZE) { err = "bad_value:too_many_words"; return false; }
            out = make_write_words(addr, words.data(), words.size());
            return true;
        }
    }

    err = "unknown_command";
    return false;
}

bool build_command(const std::string& name, const std::vector<std::string>& args,
                   Command& out, std::string& err) {
    CommandId id;
    if (!name_to_id(name, id)) {
        err = "unknown_command:" + name;
        return false;
    }
    return build_command_from_id(id, args, out, err);
}

} // namespace hf2

// -----------------------------------------------------------------------------
// pretty.cpp — key=value rendering for hf2-cli
//
// Format reference: include/pretty.hpp
// -----------------------------------------------------------------------------
#include "pretty.hpp"
#include "hf2/command.hpp"

#include <iomanip>
#include <sstream>

namespace hf2 {

std::string bininfo_mode_name(uint32_t mode) {
    if (mode == BININFO_MODE_BOOTLOADER) return "bootloader";
    if (mode == BININFO_MODE_USER)       return "user";
    return std::to_string(mode);
}

// fixed-width hex without leaking stream flags
template <typename T>
static void put_hex(std::ostringstream& os, T v, int width) {
    std::ios_base::fmtflags f0 = os.flags();
    char fill0 = os.fill();
    os << "0x" << std::hex << std::setw(width) << std::setfill('0') << (unsigned long)v;
    os.flags(f0);
    os.fill(fill0);
}

std::string decode_pretty(const Result& result) {
    std::ostringstream os;

    if (result.error != Error::Ok) {
        os << "status=error tag=" << result.tag
           << " cmd=" << command_name(result.command)
           << " reason=" << error_name(result.error);
        return os.str();
    }

    const Response& r = result.response;
    os << "status=" << status_name(r.status)
       << " tag=" << r.tag
       << " cmd=" << command_name(result.command);

    if (r.status != ResponseStatus::Ok) {
        os << " info=" << unsigned(r.status_info);
        return os.str();
    }

    if (const results::BinInfo* b = etl::get_if<results::BinInfo>(&r.data)) {
        os << " mode=" << bininfo_mode_name(b->mode)
           << " page_size=" << b->flash_page_size
           << " num_pages=" << b->flash_num_pages
           << " max_msg=" << b->max_message_size;
        if (b->has_family_id) {
            os << " family_id=";
            put_hex(os, b->family_id, 8);
        }
    } else if (const results::Text* t = etl::get_if<results::Text>(&r.data)) {
        os << " len=" << t->text.size();
    } else if (const results::Checksums* c = etl::get_if<results::Checksums>(&r.data)) {
        os << " count=" << c->values.size() << " checksums=";
        for (size_t i = 0; i < c->values.size(); ++i) {
            if (i) os << ",";
            put_hex(os, c->values[i], 4);
        }
    } else if (const results::Words* w = etl::get_if<results::Words>(&r.data)) {
        os << " count=" << w->values.size() << " words=";
        for (size_t i = 0; i < w->values.size(); ++i) {
            if (i) os << ",";
            put_hex(os, w->values[i], 8);
        }
    }
    return os.str();
}

std::string event_pretty(const DiagnosticEvent& evt) {
    std::ostringstream os;
    os << "event=" << error_name(evt.code)
       << " channel=" << channel_name(evt.channel)
       << " tag=" << evt.tag
       << " detail=" << evt.detail;
    return os.str();
}

} // namespace hf2

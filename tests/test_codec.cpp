#include <doctest/doctest.h>
#include "hf2/codec.hpp"

using namespace hf2;

TEST_CASE("Command header is id then tag, little-endian") {
    Command c = make_bin_info();
    c.tag = 0x1234;
    ByteBuffer out;
    REQUIRE(encode_command(c, out) == Error::Ok);
    REQUIRE(out.size() == 4);
    CHECK(out[0] == 0x01);
    CHECK(out[1] == 0x00);
    CHECK(out[2] == 0x34);
    CHECK(out[3] == 0x12);
}

TEST_CASE("ReadWords encodes address and count") {
    Command c = make_read_words(0x20000000, 4);
    c.tag = 7;
    ByteBuffer out;
    REQUIRE(encode_command(c, out) == Error::Ok);
    REQUIRE(out.size() == 12);
    CHECK(out[0] == 0x08);
    CHECK(out[7] == 0x20);
    CHECK(out[8] == 4);

    Command back;
    REQUIRE(decode_command(out.data(), out.size(), back) == Error::Ok);
    CHECK(back.id == CommandId::ReadWords);
    CHECK(back.tag == 7);
    const args::Range* r = etl::get_if<args::Range>(&back.args);
    REQUIRE(r != nullptr);
    CHECK(r->target_addr == 0x20000000u);
    CHECK(r->count == 4);
}

TEST_CASE("WriteWords derives its count from the word list") {
    const uint32_t words[] = {0xAABBCCDD, 0x11223344};
    Command c = make_write_words(0x1000, words, 2);
    ByteBuffer out;
    REQUIRE(encode_command(c, out) == Error::Ok);
    REQUIRE(out.size() == 4 + 8 + 8);
    CHECK(get_u32(out.data() + 8) == 2);
    CHECK(get_u32(out.data() + 12) == 0xAABBCCDDu);

    Command back;
    REQUIRE(decode_command(out.data(), out.size(), back) == Error::Ok);
    const args::Words* w = etl::get_if<args::Words>(&back.args);
    REQUIRE(w != nullptr);
    REQUIRE(w->words.size() == 2);
    CHECK(w->words[1] == 0x11223344u);

    // lie about the count
    out[8] = 3;
    CHECK(decode_command(out.data(), out.size(), back) == Error::PayloadLengthMismatch);
}

TEST_CASE("WriteFlashPage carries the rest of the message as page data") {
    uint8_t page[256];
    for (size_t i = 0; i < sizeof(page); ++i) page[i] = static_cast<uint8_t>(i);
    Command c = make_write_flash_page(0x2000, page, sizeof(page));
    ByteBuffer out;
    REQUIRE(encode_command(c, out) == Error::Ok);
    CHECK(out.size() == 4 + 4 + 256);

    Command back;
    REQUIRE(decode_command(out.data(), out.size(), back) == Error::Ok);
    const args::FlashPage* fp = etl::get_if<args::FlashPage>(&back.args);
    REQUIRE(fp != nullptr);
    CHECK(fp->target_addr == 0x2000u);
    REQUIRE(fp->data.size() == 256);
    CHECK(fp->data[255] == 255);
}

TEST_CASE("encode_command rejects unknown ids, mismatched args and oversize payloads") {
    Command c;
    c.id = static_cast<CommandId>(0x0042);
    ByteBuffer out;
    CHECK(encode_command(c, out) == Error::UnknownCommand);

    Command wrong = make_bin_info();
    wrong.args.emplace<args::Range>();
    CHECK(encode_command(wrong, out) == Error::UnknownCommand);

    Command big = make_write_flash_page(0, nullptr, 0);
    args::FlashPage& fp = etl::get<args::FlashPage>(big.args);
    fp.data.resize(MAX_MESSAGE_SIZE - 4);       // + 8 header bytes > max
    CHECK(encode_command(big, out) == Error::MessageTooLarge);
    CHECK(out.empty());
}

TEST_CASE("decode_command error kinds") {
    Command out;
    const uint8_t short_msg[] = {0x01, 0x00, 0x05};
    CHECK(decode_command(short_msg, sizeof(short_msg), out) == Error::TruncatedMessage);

    const uint8_t unknown[] = {0x42, 0x00, 0x09, 0x00};
    CHECK(decode_command(unknown, sizeof(unknown), out) == Error::UnsupportedCommand);
    CHECK(out.tag == 9);                       // tag still recovered

    const uint8_t extra[] = {0x01, 0x00, 0x01, 0x00, 0xFF};
    CHECK(decode_command(extra, sizeof(extra), out) == Error::PayloadLengthMismatch);

    const uint8_t range_short[] = {0x08, 0x00, 0x01, 0x00, 0, 0, 0, 0x20, 4};
    CHECK(decode_command(range_short, sizeof(range_short), out) == Error::TruncatedMessage);

    const uint8_t range_long[] = {0x07, 0x00, 0x01, 0x00, 0, 0, 0, 0, 1, 0, 0, 0, 0xEE};
    CHECK(decode_command(range_long, sizeof(range_long), out) == Error::PayloadLengthMismatch);

    const uint8_t page_short[] = {0x06, 0x00, 0x01, 0x00, 0, 0};
    CHECK(decode_command(page_short, sizeof(page_short), out) == Error::TruncatedMessage);
}

TEST_CASE("BinInfo response with and without family id") {
    Response r = make_ok(3);
    results::BinInfo& b = r.data.emplace<results::BinInfo>();
    b.mode = BININFO_MODE_BOOTLOADER;
    b.flash_page_size = 256;
    b.flash_num_pages = 1024;
    b.max_message_size = 1024;

    ByteBuffer out;
    REQUIRE(encode_response(r, CommandId::BinInfo, out) == Error::Ok);
    CHECK(out.size() == 20);

    Response back;
    REQUIRE(decode_response(out.data(), out.size(), CommandId::BinInfo, back) == Error::Ok);
    CHECK(back.tag == 3);
    CHECK(back.status == ResponseStatus::Ok);
    const results::BinInfo* bb = etl::get_if<results::BinInfo>(&back.data);
    REQUIRE(bb != nullptr);
    CHECK(bb->flash_page_size == 256);
    CHECK_FALSE(bb->has_family_id);

    etl::get<results::BinInfo>(r.data).has_family_id = true;
    etl::get<results::BinInfo>(r.data).family_id = 0x68ED2B88;
    REQUIRE(encode_response(r, CommandId::BinInfo, out) == Error::Ok);
    CHECK(out.size() == 24);
    REQUIRE(decode_response(out.data(), out.size(), CommandId::BinInfo, back) == Error::Ok);
    bb = etl::get_if<results::BinInfo>(&back.data);
    REQUIRE(bb != nullptr);
    CHECK(bb->has_family_id);
    CHECK(bb->family_id == 0x68ED2B88u);

    CHECK(decode_response(out.data(), 19, CommandId::BinInfo, back) == Error::TruncatedMessage);
    CHECK(decode_response(out.data(), 22, CommandId::BinInfo, back) == Error::PayloadLengthMismatch);
}

TEST_CASE("Text, checksum and word payloads") {
    ByteBuffer out;
    Response back;

    Response info = make_ok(1);
    info.data.emplace<results::Text>().text.assign("UF2 Bootloader v3.14");
    REQUIRE(encode_response(info, CommandId::Info, out) == Error::Ok);
    REQUIRE(decode_response(out.data(), out.size(), CommandId::Info, back) == Error::Ok);
    const results::Text* t = etl::get_if<results::Text>(&back.data);
    REQUIRE(t != nullptr);
    CHECK(t->text == TextBuffer("UF2 Bootloader v3.14"));

    const uint8_t sums[] = {0x02, 0x00, 0, 0, 0x34, 0x12, 0x78, 0x56};
    REQUIRE(decode_response(sums, sizeof(sums), CommandId::ChecksumPages, back) == Error::Ok);
    const results::Checksums* c = etl::get_if<results::Checksums>(&back.data);
    REQUIRE(c != nullptr);
    REQUIRE(c->values.size() == 2);
    CHECK(c->values[0] == 0x1234);
    CHECK(c->values[1] == 0x5678);
    CHECK(decode_response(sums, 7, CommandId::ChecksumPages, back) == Error::PayloadLengthMismatch);

    const uint8_t words[] = {0x02, 0x00, 0, 0, 0x44, 0x33, 0x22, 0x11};
    REQUIRE(decode_response(words, sizeof(words), CommandId::ReadWords, back) == Error::Ok);
    const results::Words* w = etl::get_if<results::Words>(&back.data);
    REQUIRE(w != nullptr);
    CHECK(w->values[0] == 0x11223344u);
    CHECK(decode_response(words, 6, CommandId::ReadWords, back) == Error::PayloadLengthMismatch);
}

TEST_CASE("Request-aware decode checks the element count of ranged reads") {
    Command req = make_read_words(0, 2);
    const uint8_t one_word[] = {0x05, 0x00, 0, 0, 1, 0, 0, 0};
    Response back;
    CHECK(decode_response(one_word, sizeof(one_word), req, back) == Error::PayloadLengthMismatch);

    req = make_read_words(0, 1);
    CHECK(decode_response(one_word, sizeof(one_word), req, back) == Error::Ok);
}

TEST_CASE("Failure replies are header-only and their payload is ignored") {
    ByteBuffer out;
    Response err = make_error(9, ResponseStatus::NotRecognized);
    REQUIRE(encode_response(err, static_cast<CommandId>(0x0077), out) == Error::Ok);
    CHECK(out.size() == 4);
    CHECK(out[2] == 1);

    const uint8_t with_junk[] = {0x09, 0x00, 0x02, 0x05, 0xDE, 0xAD};
    Response back;
    REQUIRE(decode_response(with_junk, sizeof(with_junk), CommandId::ReadWords, back) == Error::Ok);
    CHECK(back.status == ResponseStatus::ExecutionError);
    CHECK(back.status_info == 5);
    CHECK(etl::holds_alternative<results::None>(back.data));
}

TEST_CASE("Response error kinds") {
    Response back;
    const uint8_t bad_status[] = {0x01, 0x00, 0x07, 0x00};
    CHECK(decode_response(bad_status, sizeof(bad_status), CommandId::Info, back) == Error::UnknownStatus);

    const uint8_t three[] = {0x01, 0x00, 0x00};
    CHECK(decode_response(three, sizeof(three), CommandId::Info, back) == Error::TruncatedMessage);

    const uint8_t reset_extra[] = {0x01, 0x00, 0x00, 0x00, 0x01};
    CHECK(decode_response(reset_extra, sizeof(reset_extra), CommandId::ResetIntoApp, back)
          == Error::PayloadLengthMismatch);

    Response r = make_ok(1);
    r.status = static_cast<ResponseStatus>(9);
    ByteBuffer out;
    CHECK(encode_response(r, CommandId::Info, out) == Error::UnknownStatus);

    Response mismatched = make_ok(1);                  // None data for a Text reply
    CHECK(encode_response(mismatched, CommandId::Info, out) == Error::UnknownCommand);
}

TEST_CASE("peek helpers read tags without decoding") {
    const uint8_t cmd[] = {0x02, 0x00, 0xCD, 0xAB};
    uint16_t id = 0, tag = 0;
    REQUIRE(peek_command_header(cmd, sizeof(cmd), id, tag) == Error::Ok);
    CHECK(id == 2);
    CHECK(tag == 0xABCD);
    REQUIRE(peek_response_tag(cmd, sizeof(cmd), tag) == Error::Ok);
    CHECK(tag == 0x0002);
    CHECK(peek_response_tag(cmd, 2, tag) == Error::TruncatedMessage);
}

static bool same_args(const CommandArgs& a, const CommandArgs& b) {
    if (a.index() != b.index()) return false;
    if (const args::FlashPage* x = etl::get_if<args::FlashPage>(&a)) {
        const args::FlashPage& y = etl::get<args::FlashPage>(b);
        return x->target_addr == y.target_addr && x->data == y.data;
    }
    if (const args::Range* x = etl::get_if<args::Range>(&a)) {
        const args::Range& y = etl::get<args::Range>(b);
        return x->target_addr == y.target_addr && x->count == y.count;
    }
    if (const args::Words* x = etl::get_if<args::Words>(&a)) {
        const args::Words& y = etl::get<args::Words>(b);
        return x->target_addr == y.target_addr && x->words == y.words;
    }
    return true;                       // args::None
}

TEST_CASE("Every command id survives encode then decode") {
    const uint8_t page[] = {0x10, 0x20, 0x30, 0x40, 0x50};
    const uint32_t words[] = {1, 0xFFFFFFFF, 0x12345678};

    const Command table[] = {
        make_bin_info(),
        make_info(),
        make_reset_into_app(),
        make_reset_into_bootloader(),
        make_start_flash(),
        make_write_flash_page(0x00004000, page, sizeof(page)),
        make_checksum_pages(0x00002000, 12),
        make_read_words(0x20000100, 7),
        make_write_words(0x20000200, words, 3),
        make_dmesg(),
    };

    uint16_t tag = 0x0100;
    for (Command cmd : table) {
        CAPTURE(command_name(cmd.id));
        cmd.tag = tag++;

        ByteBuffer bytes;
        REQUIRE(encode_command(cmd, bytes) == Error::Ok);

        Command back;
        REQUIRE(decode_command(bytes.data(), bytes.size(), back) == Error::Ok);
        CHECK(back.id == cmd.id);
        CHECK(back.tag == cmd.tag);
        CHECK(same_args(back.args, cmd.args));
    }
}

static bool same_data(const ResponseData& a, const ResponseData& b) {
    if (a.index() != b.index()) return false;
    if (const results::BinInfo* x = etl::get_if<results::BinInfo>(&a)) {
        const results::BinInfo& y = etl::get<results::BinInfo>(b);
        return x->mode == y.mode && x->flash_page_size == y.flash_page_size &&
               x->flash_num_pages == y.flash_num_pages && x->max_message_size == y.max_message_size &&
               x->has_family_id == y.has_family_id && x->family_id == y.family_id;
    }
    if (const results::Text* x = etl::get_if<results::Text>(&a)) {
        return x->text == etl::get<results::Text>(b).text;
    }
    if (const results::Checksums* x = etl::get_if<results::Checksums>(&a)) {
        return x->values == etl::get<results::Checksums>(b).values;
    }
    if (const results::Words* x = etl::get_if<results::Words>(&a)) {
        return x->values == etl::get<results::Words>(b).values;
    }
    return true;                       // results::None
}

// An Ok reply with a representative payload for the id's result layout.
static Response sample_reply(CommandId id, uint16_t tag) {
    Response r = make_ok(tag);
    switch (result_layout(id)) {
        case ResultLayout::Empty:
            break;
        case ResultLayout::BinInfo: {
            results::BinInfo& b = r.data.emplace<results::BinInfo>();
            b.mode = BININFO_MODE_USER;
            b.flash_page_size = 64;
            b.flash_num_pages = 4096;
            b.max_message_size = 256;
            b.has_family_id = true;
            b.family_id = 0xE48BFF56;
            break;
        }
        case ResultLayout::Text:
            r.data.emplace<results::Text>().text.assign("line one\nline two\n");
            break;
        case ResultLayout::Checksums: {
            results::Checksums& c = r.data.emplace<results::Checksums>();
            c.values.push_back(0x0000);
            c.values.push_back(0xFFFF);
            c.values.push_back(0x1D0F);
            break;
        }
        case ResultLayout::Words: {
            results::Words& w = r.data.emplace<results::Words>();
            w.values.push_back(0xDEADBEEF);
            w.values.push_back(0x00000000);
            break;
        }
    }
    return r;
}

TEST_CASE("Every result layout survives encode then decode") {
    const CommandId ids[] = {
        CommandId::BinInfo, CommandId::Info, CommandId::ResetIntoApp,
        CommandId::ResetIntoBootloader, CommandId::StartFlash, CommandId::WriteFlashPage,
        CommandId::ChecksumPages, CommandId::ReadWords, CommandId::WriteWords, CommandId::Dmesg,
    };

    uint16_t tag = 0x0200;
    for (CommandId id : ids) {
        CAPTURE(command_name(id));
        const Response resp = sample_reply(id, tag++);

        ByteBuffer bytes;
        REQUIRE(encode_response(resp, id, bytes) == Error::Ok);

        Response back;
        REQUIRE(decode_response(bytes.data(), bytes.size(), id, back) == Error::Ok);
        CHECK(back.tag == resp.tag);
        CHECK(back.status == ResponseStatus::Ok);
        CHECK(back.status_info == 0);
        CHECK(same_data(back.data, resp.data));

        // every id also carries a header-only failure reply
        const Response fail = make_error(resp.tag, ResponseStatus::ExecutionError, 3);
        REQUIRE(encode_response(fail, id, bytes) == Error::Ok);
        REQUIRE(decode_response(bytes.data(), bytes.size(), id, back) == Error::Ok);
        CHECK(back.status == ResponseStatus::ExecutionError);
        CHECK(back.status_info == 3);
        CHECK(etl::holds_alternative<results::None>(back.data));
    }
}

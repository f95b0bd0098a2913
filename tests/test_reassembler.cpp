#include <doctest/doctest.h>
#include "hf2/reassembler.hpp"

using namespace hf2;

static Packet make(PacketKind kind, const uint8_t* data, size_t len) {
    Packet p;
    REQUIRE(Packet::build(kind, data, len, p) == Error::Ok);
    return p;
}

TEST_CASE("Three fragments (63 + 63 + 4) reassemble into one 130-byte message") {
    uint8_t msg[130];
    for (size_t i = 0; i < sizeof(msg); ++i) msg[i] = static_cast<uint8_t>(i);

    Reassembler r(256);
    Message out;

    CHECK(r.feed(make(PacketKind::CommandMore, msg, 63), out) == FeedResult::Pending);
    CHECK(r.state() == Reassembler::State::Accumulating);
    CHECK(r.pending_size() == 63);
    CHECK(r.feed(make(PacketKind::CommandMore, msg + 63, 63), out) == FeedResult::Pending);
    REQUIRE(r.feed(make(PacketKind::CommandFinal, msg + 126, 4), out) == FeedResult::Complete);

    CHECK(out.channel == Channel::Command);
    REQUIRE(out.size() == 130);
    for (size_t i = 0; i < 130; ++i) CHECK(out.data[i] == msg[i]);
    CHECK(r.state() == Reassembler::State::Idle);
    CHECK(r.pending_size() == 0);
}

TEST_CASE("Single final fragment is a complete message; empty final too") {
    const uint8_t b[] = {1, 2, 3, 4};
    Reassembler r;
    Message out;
    REQUIRE(r.feed(make(PacketKind::CommandFinal, b, 4), out) == FeedResult::Complete);
    CHECK(out.size() == 4);

    REQUIRE(r.feed(make(PacketKind::CommandFinal, nullptr, 0), out) == FeedResult::Complete);
    CHECK(out.empty());
}

TEST_CASE("Serial packet mid-reassembly is yielded and leaves accumulation intact") {
    uint8_t a[63], b[10];
    for (size_t i = 0; i < 63; ++i) a[i] = 0x11;
    for (size_t i = 0; i < 10; ++i) b[i] = 0x22;
    const uint8_t text[] = {'b', 'o', 'o', 't', 'i', 'n', 'g', '.', '.', '\n'};

    Reassembler r;
    Message out;
    CHECK(r.feed(make(PacketKind::CommandMore, a, 63), out) == FeedResult::Pending);

    REQUIRE(r.feed(make(PacketKind::SerialStdout, text, 10), out) == FeedResult::Complete);
    CHECK(out.channel == Channel::Stdout);
    CHECK(out.size() == 10);
    CHECK(r.state() == Reassembler::State::Accumulating);
    CHECK(r.pending_size() == 63);

    REQUIRE(r.feed(make(PacketKind::CommandFinal, b, 10), out) == FeedResult::Complete);
    CHECK(out.channel == Channel::Command);
    REQUIRE(out.size() == 73);
    CHECK(out.data[0] == 0x11);
    CHECK(out.data[72] == 0x22);
}

TEST_CASE("Raw reports: stdout vector with padding") {
    const uint8_t report[] = {0x83, 1, 2, 3, 0xAB, 0xFF, 0xFF, 0xFF};
    Reassembler r;
    Message out;
    REQUIRE(r.feed(report, sizeof(report), out) == FeedResult::Complete);
    CHECK(out.channel == Channel::Stdout);
    REQUIRE(out.size() == 3);
    CHECK(out.data[2] == 3);
}

TEST_CASE("Overflow swallows the rest of the oversize message; the next one reassembles") {
    uint8_t chunk[63] = {};
    Reassembler r(100);
    Message out;

    CHECK(r.feed(make(PacketKind::CommandMore, chunk, 63), out) == FeedResult::Pending);
    CHECK(r.feed(make(PacketKind::CommandMore, chunk, 63), out) == FeedResult::Dropped);
    CHECK(r.last_error() == Error::MessageTooLarge);
    CHECK(r.state() == Reassembler::State::Discarding);
    CHECK(r.pending_size() == 0);

    // remaining fragments of the same message, shaped like a valid command
    const uint8_t looks_valid[] = {0x06, 0x00, 0x2A, 0x00, 0x00, 0x20, 0x00, 0x00};
    CHECK(r.feed(make(PacketKind::CommandMore, looks_valid, sizeof(looks_valid)), out) == FeedResult::Pending);
    CHECK(r.pending_size() == 0);

    // serial output still gets through while the tail is discarded
    const uint8_t log[] = {'.'};
    REQUIRE(r.feed(make(PacketKind::SerialStdout, log, 1), out) == FeedResult::Complete);
    CHECK(out.channel == Channel::Stdout);

    CHECK(r.feed(make(PacketKind::CommandFinal, looks_valid, sizeof(looks_valid)), out) == FeedResult::Pending);
    CHECK(r.state() == Reassembler::State::Idle);

    // next real message
    const uint8_t ok[] = {9, 8, 7, 6};
    REQUIRE(r.feed(make(PacketKind::CommandFinal, ok, 4), out) == FeedResult::Complete);
    CHECK(out.channel == Channel::Command);
    REQUIRE(out.size() == 4);
    CHECK(out.data[0] == 9);
    CHECK(r.last_error() == Error::Ok);
}

TEST_CASE("Overflow on a final fragment has no tail to discard") {
    uint8_t chunk[63] = {};
    Reassembler r(100);
    Message out;
    CHECK(r.feed(make(PacketKind::CommandMore, chunk, 63), out) == FeedResult::Pending);
    CHECK(r.feed(make(PacketKind::CommandFinal, chunk, 63), out) == FeedResult::Dropped);
    CHECK(r.state() == Reassembler::State::Idle);

    const uint8_t ok[] = {1, 0, 1, 0};
    CHECK(r.feed(make(PacketKind::CommandFinal, ok, 4), out) == FeedResult::Complete);
}

TEST_CASE("Malformed header mid-message discards through the next final") {
    uint8_t chunk[63] = {};
    Reassembler r;
    Message out;
    CHECK(r.feed(make(PacketKind::CommandMore, chunk, 63), out) == FeedResult::Pending);

    const uint8_t bad[] = {0x00};
    CHECK(r.feed(bad, sizeof(bad), out) == FeedResult::Dropped);
    CHECK(r.last_error() == Error::MalformedHeader);
    CHECK(r.state() == Reassembler::State::Discarding);

    const uint8_t overflow[] = {0x45, 1, 2};
    CHECK(r.feed(overflow, sizeof(overflow), out) == FeedResult::Dropped);
    CHECK(r.last_error() == Error::LengthOverflow);

    CHECK(r.feed(make(PacketKind::CommandFinal, chunk, 10), out) == FeedResult::Pending);
    CHECK(r.state() == Reassembler::State::Idle);
}

TEST_CASE("Malformed header while idle leaves the stream idle") {
    Reassembler r;
    Message out;
    const uint8_t bad[] = {0x00};
    CHECK(r.feed(bad, sizeof(bad), out) == FeedResult::Dropped);
    CHECK(r.state() == Reassembler::State::Idle);

    const uint8_t ok[] = {0x42, 1, 2};
    CHECK(r.feed(ok, sizeof(ok), out) == FeedResult::Complete);
}

TEST_CASE("abort() ends discarding") {
    uint8_t chunk[63] = {};
    Reassembler r(64);
    Message out;
    CHECK(r.feed(make(PacketKind::CommandMore, chunk, 63), out) == FeedResult::Pending);
    CHECK(r.feed(make(PacketKind::CommandMore, chunk, 63), out) == FeedResult::Dropped);
    REQUIRE(r.state() == Reassembler::State::Discarding);
    r.abort();
    CHECK(r.state() == Reassembler::State::Idle);
}

TEST_CASE("abort() discards partial data") {
    uint8_t chunk[20] = {};
    Reassembler r;
    Message out;
    CHECK(r.feed(make(PacketKind::CommandMore, chunk, 20), out) == FeedResult::Pending);
    r.abort();
    CHECK(r.pending_size() == 0);
    CHECK(r.state() == Reassembler::State::Idle);
}

TEST_CASE("Runtime maximum is clamped to the compile-time maximum") {
    Reassembler r(MAX_MESSAGE_SIZE * 4);
    CHECK(r.max_message_size() == MAX_MESSAGE_SIZE);
}

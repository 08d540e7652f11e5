#include <doctest/doctest.h>
#include "ssplink/sequencer.hpp"
#include "fake_channel.hpp"
#include "recording_reporter.hpp"

using namespace ssplink;
using ssplink::test::FakeChannel;
using ssplink::test::RecordingReporter;

static SequenceOptions fast_options() {
    SequenceOptions o;
    o.delay_ms = 0;
    o.read_timeout_ms = 10;
    return o;
}

static const LinkConfig kLink{19200, false, true};

TEST_CASE("default command list is SYNC, SETUP_REQUEST, ENABLE, POLL") {
    auto cmds = default_command_sequence();
    REQUIRE(cmds.size() == 4);
    CHECK(cmds[0].opcode == CMD_SYNC);
    CHECK(cmds[1].opcode == CMD_SETUP_REQUEST);
    CHECK(cmds[2].opcode == CMD_ENABLE);
    CHECK(cmds[3].opcode == CMD_POLL);
    CHECK(std::string(cmds[1].name) == "SETUP_REQUEST");

    SequenceOptions o;
    CHECK(o.delay_ms == 500);
    CHECK(o.extra_polls == 3);
}

TEST_CASE("silent device: four commands, counter still advances, run succeeds") {
    FakeChannel ch;
    RecordingReporter rep;

    auto r = run_sequence(ch, "/dev/ttyUSB0", kLink, fast_options(), rep);

    REQUIRE(r.ok());
    REQUIRE(r->outcomes.size() == 4);
    CHECK(r->responses() == 0);
    CHECK(r->final_sequence == 0x84);

    const uint8_t want_seq[] = {0x80, 0x81, 0x82, 0x83};
    const uint8_t want_op[]  = {CMD_SYNC, CMD_SETUP_REQUEST, CMD_ENABLE, CMD_POLL};
    for (size_t i = 0; i < 4; ++i) {
        CHECK(r->outcomes[i].sequence == want_seq[i]);
        CHECK(r->outcomes[i].opcode == want_op[i]);
        CHECK_FALSE(r->outcomes[i].responded);
        CHECK(ch.writes[i].bytes[1] == want_seq[i]);
        CHECK(test::opcode_of(ch.writes[i].bytes) == want_op[i]);
    }
    CHECK(rep.count("command_response") == 4);
    CHECK(ch.closes == 1);
    CHECK_FALSE(ch.is_open());
}

TEST_CASE("port is opened at the discovered link with its line levels") {
    FakeChannel ch;
    RecordingReporter rep;

    run_sequence(ch, "/dev/ttyACM1", kLink, fast_options(), rep);

    REQUIRE(ch.opens.size() == 1);
    CHECK(ch.opens[0].path == "/dev/ttyACM1");
    CHECK(ch.opens[0].baud == 19200);
    REQUIRE_FALSE(ch.writes.empty());
    CHECK_FALSE(ch.writes[0].dtr);
    CHECK(ch.writes[0].rts);
}

TEST_CASE("answered POLL triggers three follow-up polls at the next sequence values") {
    FakeChannel ch;
    RecordingReporter rep;
    ch.responder = [](const FakeChannel&, const std::vector<uint8_t>& req) {
        return test::ok_reply(req);
    };

    auto r = run_sequence(ch, "/dev/ttyUSB0", kLink, fast_options(), rep);

    REQUIRE(r.ok());
    REQUIRE(r->outcomes.size() == 7);
    CHECK(r->responses() == 7);

    for (unsigned i = 1; i <= 3; ++i) {
        const auto& o = r->outcomes[3 + i];
        CHECK(o.opcode == CMD_POLL);
        CHECK(o.extra_poll == i);
        CHECK(o.sequence == 0x83 + i);
        CHECK(o.crc_ok);
    }
    // follow-ups do not move the main counter
    CHECK(r->final_sequence == 0x84);
    CHECK(rep.count("extra_polls") == 1);
}

TEST_CASE("a silent follow-up poll does not stop the others") {
    FakeChannel ch;
    RecordingReporter rep;
    int polls = 0;
    ch.responder = [&polls](const FakeChannel&, const std::vector<uint8_t>& req) {
        if (test::opcode_of(req) != CMD_POLL) return std::vector<uint8_t>{};
        ++polls;
        if (polls == 2) return std::vector<uint8_t>{};      // first follow-up goes unanswered
        return test::ok_reply(req);
    };

    auto r = run_sequence(ch, "/dev/ttyUSB0", kLink, fast_options(), rep);

    REQUIRE(r.ok());
    REQUIRE(r->outcomes.size() == 7);
    CHECK(r->outcomes[3].responded);
    CHECK_FALSE(r->outcomes[4].responded);
    CHECK(r->outcomes[5].responded);
    CHECK(r->outcomes[6].responded);
}

TEST_CASE("no follow-up polls when POLL itself is unanswered") {
    FakeChannel ch;
    RecordingReporter rep;
    ch.responder = [](const FakeChannel&, const std::vector<uint8_t>& req) {
        if (test::opcode_of(req) == CMD_POLL) return std::vector<uint8_t>{};
        return test::ok_reply(req);
    };

    auto r = run_sequence(ch, "/dev/ttyUSB0", kLink, fast_options(), rep);

    REQUIRE(r.ok());
    CHECK(r->outcomes.size() == 4);
    CHECK(r->responses() == 3);
    CHECK(rep.count("extra_polls") == 0);
}

TEST_CASE("extra_polls is configurable") {
    FakeChannel ch;
    RecordingReporter rep;
    ch.responder = [](const FakeChannel&, const std::vector<uint8_t>& req) {
        return test::ok_reply(req);
    };
    auto opt = fast_options();
    opt.extra_polls = 0;

    auto r = run_sequence(ch, "/dev/ttyUSB0", kLink, opt, rep);
    REQUIRE(r.ok());
    CHECK(r->outcomes.size() == 4);
}

TEST_CASE("transport failure aborts the run and still closes the port") {
    FakeChannel ch;
    RecordingReporter rep;
    ch.fail_read_at = 2;                                    // SETUP_REQUEST read fails

    auto r = run_sequence(ch, "/dev/ttyUSB0", kLink, fast_options(), rep);

    CHECK_FALSE(r.ok());
    CHECK(r.status == Status::TransportFault);
    CHECK(ch.writes.size() == 2);                           // nothing after the fault
    CHECK(ch.closes == 1);
    CHECK_FALSE(ch.is_open());

    // SYNC finished before the fault and is kept
    REQUIRE(r.value.has_value());
    REQUIRE(r->outcomes.size() == 1);
    CHECK(r->outcomes[0].opcode == CMD_SYNC);
    CHECK(r->outcomes[0].sequence == 0x80);
    CHECK(r->final_sequence == 0x81);

    const auto* ev = rep.first("sequence_fault");
    REQUIRE(ev != nullptr);
    CHECK(ev->get("step") == "read");
    CHECK(ev->get("baud") == "19200");
}

TEST_CASE("write failure is fatal too") {
    FakeChannel ch;
    RecordingReporter rep;
    ch.fail_write_at = 3;

    auto r = run_sequence(ch, "/dev/ttyUSB0", kLink, fast_options(), rep);

    CHECK(r.status == Status::TransportFault);
    CHECK(ch.reads == 2);
    CHECK(ch.closes == 1);
}

TEST_CASE("open failure is a transport fault") {
    FakeChannel ch;
    RecordingReporter rep;
    ch.open_policy = [](const transport::SerialConfig&) { return false; };

    auto r = run_sequence(ch, "/dev/ttyUSB0", kLink, fast_options(), rep);

    CHECK(r.status == Status::TransportFault);
    CHECK(ch.writes.empty());
    CHECK(ch.closes == 0);
    CHECK(rep.first("sequence_fault")->get("step") == "open");
}

TEST_CASE("packet hex goes to debug events, summaries stay at info") {
    FakeChannel ch;
    RecordingReporter rep;
    ch.responder = [](const FakeChannel&, const std::vector<uint8_t>& req) { return test::ok_reply(req); };
    auto opt = fast_options();
    opt.extra_polls = 0;

    auto r = run_sequence(ch, "/dev/ttyUSB0", kLink, opt, rep);
    REQUIRE(r.ok());

    for (const auto& e : rep.events) {
        if (e.name == "command_tx" || e.name == "command_response") {
            CHECK(e.level != Level::Debug);
            CHECK(e.get("tx").empty());
            CHECK(e.get("rx").empty());
        }
    }
    CHECK(rep.count("packet_tx") == 4);
    CHECK(rep.count("packet_rx") == 4);

    const auto* tx = rep.first("packet_tx");
    REQUIRE(tx != nullptr);
    CHECK(tx->level == Level::Debug);
    CHECK(tx->get("command") == "SYNC");
    CHECK(tx->get("tx") == "7f800111a1ff");
    CHECK(rep.first("packet_rx")->level == Level::Debug);
}

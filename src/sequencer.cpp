// ============================================================================
// sequencer.cpp - implementation for sequencer.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file sequencer.cpp
 */

#include "ssplink/sequencer.hpp"

#include <chrono>
#include <thread>
#include <utility>

namespace ssplink {

std::vector<CommandDescriptor> default_command_sequence() {
    return {{CMD_SYNC, "SYNC"},
            {CMD_SETUP_REQUEST, "SETUP_REQUEST"},
            {CMD_ENABLE, "ENABLE"},
            {CMD_POLL, "POLL"}};
}

size_t SequenceReport::responses() const {
    size_t n = 0;
    for (const auto& o : outcomes) if (o.responded) ++n;
    return n;
}


// -------- helpers --------

namespace {

// Carries what every step needs so helpers stay short.
struct Run {
    transport::ISerialChannel& ch;
    const std::string&         path;
    const LinkConfig&          link;
    const SequenceOptions&     opt;
    IReporter&                 rep;
    std::string                error;

    Fields where() const {
        return {{"port", path}, {"baud", static_cast<unsigned>(link.baud)},
                {"dtr", link.dtr}, {"rts", link.rts}};
    }

    bool fail(const char* step) {
        error = std::string(step) + ": " + ch.last_error();
        Fields f = where();
        f.emplace_back("step", step);
        f.emplace_back("reason", ch.last_error());
        rep.error("sequence_fault", f);
        return false;
    }
};

/*
 * exchange()
 * ----------
 * write -> fixed delay -> timed read. Fills `out` and returns false only on a
 * transport failure; a silent device is a normal outcome.
 */
bool exchange(Run& run, uint8_t opcode, const char* name, uint8_t seq,
              unsigned extra, CommandOutcome& out) {
    out = CommandOutcome{};
    out.opcode     = opcode;
    out.name       = name;
    out.sequence   = seq;
    out.extra_poll = extra;

    auto pkt = build_packet(opcode, seq);
    if (!pkt) {
        run.error = pkt.detail;
        run.rep.error("sequence_build_failed", {{"command", name}, {"reason", pkt.detail}});
        return false;
    }

    run.rep.info("command_tx", {{"command", name}, {"seq", to_hex(&seq, 1)},
                                {"extra_poll", extra}});
    run.rep.debug("packet_tx", {{"command", name}, {"tx", to_hex(*pkt)}});
    if (run.ch.write(pkt->data(), pkt->size()) != transport::TxResult::Ok)
        return run.fail("write");

    if (run.opt.delay_ms > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(run.opt.delay_ms));

    auto rx = run.ch.read(out.response, run.opt.read_max, run.opt.read_timeout_ms);
    if (rx == transport::RxResult::Error) return run.fail("read");

    out.responded = !out.response.empty();
    out.crc_ok    = out.responded && validate_packet(out.response);

    if (out.responded) {
        run.rep.info("command_response", {{"command", name}, {"extra_poll", extra},
                                          {"response", true}, {"crc_ok", out.crc_ok}});
        run.rep.debug("packet_rx", {{"command", name}, {"rx", to_hex(out.response)}});
    } else {
        run.rep.warn("command_response", {{"command", name}, {"extra_poll", extra},
                                          {"response", false}});
    }
    return true;
}

} // namespace


// -------- public API --------

Result<SequenceReport> run_sequence(transport::ISerialChannel& channel,
                                    const std::string& path,
                                    const LinkConfig& link,
                                    const SequenceOptions& options,
                                    IReporter& reporter) {
    Run run{channel, path, link, options, reporter, {}};
    SequenceReport report;
    SequenceCounter seq;
    // Outcomes collected before the fault travel with the failure.
    auto fault = [&run, &report, &seq]() {
        report.final_sequence = seq.value();
        return Result<SequenceReport>::failure(Status::TransportFault, run.error,
                                               std::move(report));
    };

    reporter.info("sequence_start", run.where());
    if (!channel.open(make_serial_config(path, link.baud, options.read_timeout_ms))) {
        run.fail("open");
        return fault();
    }
    transport::ChannelGuard guard(channel);

    if (!channel.set_dtr(link.dtr))  { run.fail("set_dtr"); return fault(); }
    if (!channel.set_rts(link.rts))  { run.fail("set_rts"); return fault(); }
    if (!channel.flush_input() || !channel.flush_output()) { run.fail("flush"); return fault(); }

    for (const auto& cmd : options.commands) {
        CommandOutcome out;
        if (!exchange(run, cmd.opcode, cmd.name, seq.value(), 0, out)) return fault();
        const bool poll_answered = cmd.opcode == CMD_POLL && out.responded;
        report.outcomes.push_back(std::move(out));

        if (poll_answered && options.extra_polls > 0) {
            reporter.info("extra_polls", {{"count", options.extra_polls}});
            for (unsigned i = 1; i <= options.extra_polls; ++i) {
                CommandOutcome extra;
                if (!exchange(run, CMD_POLL, cmd.name, seq.at(i), i, extra)) return fault();
                report.outcomes.push_back(std::move(extra));
            }
        }
        seq.advance();
    }

    report.final_sequence = seq.value();
    reporter.info("sequence_done", {{"commands", report.outcomes.size()},
                                    {"responses", report.responses()}});
    return Result<SequenceReport>::success(std::move(report));
}

} // namespace ssplink

// ============================================================================
// discovery.cpp - implementation for discovery.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file discovery.cpp
 */

#include "ssplink/discovery.hpp"
#include "ssplink/frame.hpp"

#include <chrono>
#include <thread>

namespace ssplink {

std::vector<uint32_t> default_baud_rates() {
    return {9600, 19200, 38400, 115200};
}

std::vector<LineState> default_line_states() {
    return {{false, false}, {true, false}, {false, true}, {true, true}};
}

transport::SerialConfig make_serial_config(const std::string& path, uint32_t baud,
                                           int read_timeout_ms) {
    transport::SerialConfig cfg;
    cfg.path            = path;
    cfg.baud            = baud;
    cfg.data_bits       = 8;
    cfg.parity          = transport::Parity::None;
    cfg.stop_bits       = 1;
    cfg.read_timeout_ms = read_timeout_ms;
    return cfg;
}


// -------- helpers --------

enum class Probe : uint8_t { Answered, Silent, Fault };

// Context fields every discovery log line carries.
static Fields where(const std::string& path, uint32_t baud, const LineState& ls) {
    return {{"port", path}, {"baud", static_cast<unsigned>(baud)},
            {"dtr", ls.dtr}, {"rts", ls.rts}};
}

static Probe fault(IReporter& rep, const std::string& path, uint32_t baud,
                   const LineState& ls, const char* step,
                   const transport::ISerialChannel& ch) {
    Fields f = where(path, baud, ls);
    f.emplace_back("step", step);
    f.emplace_back("reason", ch.last_error());
    rep.warn("probe_fault", f);
    return Probe::Fault;
}

/*
 * send_probe()
 * ------------
 * Flush both directions, write one zero-payload packet with seq 0x80 and
 * wait for up to read_max bytes. Any byte at all counts as an answer.
 */
static Probe send_probe(transport::ISerialChannel& ch, uint8_t opcode,
                        const std::string& path, uint32_t baud, const LineState& ls,
                        const DiscoveryOptions& opt, IReporter& rep) {
    if (!ch.flush_input() || !ch.flush_output())
        return fault(rep, path, baud, ls, "flush", ch);

    auto pkt = build_packet(opcode, SEQ_FLAG);
    if (!pkt) {
        rep.error("probe_build_failed", {{"command", command_name(opcode)}, {"reason", pkt.detail}});
        return Probe::Fault;
    }

    rep.debug("probe_tx", {{"command", command_name(opcode)}, {"tx", to_hex(*pkt)}});
    if (ch.write(pkt->data(), pkt->size()) != transport::TxResult::Ok)
        return fault(rep, path, baud, ls, "write", ch);

    std::vector<uint8_t> resp;
    auto rx = ch.read(resp, opt.read_max, opt.read_timeout_ms);
    if (rx == transport::RxResult::Error)
        return fault(rep, path, baud, ls, "read", ch);

    if (rx == transport::RxResult::Ok && !resp.empty()) {
        rep.info("probe_response", {{"command", command_name(opcode)},
                                    {"crc_ok", validate_packet(resp)}});
        rep.debug("probe_rx", {{"command", command_name(opcode)}, {"rx", to_hex(resp)}});
        return Probe::Answered;
    }
    rep.info("probe_no_response", {{"command", command_name(opcode)}});
    return Probe::Silent;
}

/*
 * try_candidate()
 * ---------------
 * One grid cell, start to finish. The guard closes the port on every return.
 */
static Probe try_candidate(transport::ISerialChannel& ch, const std::string& path,
                           uint32_t baud, const LineState& ls,
                           const DiscoveryOptions& opt, IReporter& rep) {
    rep.info("probe_candidate", where(path, baud, ls));

    if (!ch.open(make_serial_config(path, baud, opt.read_timeout_ms)))
        return fault(rep, path, baud, ls, "open", ch);
    transport::ChannelGuard guard(ch);

    if (!ch.set_dtr(ls.dtr)) return fault(rep, path, baud, ls, "set_dtr", ch);
    if (!ch.set_rts(ls.rts)) return fault(rep, path, baud, ls, "set_rts", ch);

    if (opt.settle_ms > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(opt.settle_ms));

    for (uint8_t opcode : {CMD_SYNC, CMD_RESET}) {
        Probe p = send_probe(ch, opcode, path, baud, ls, opt, rep);
        if (p != Probe::Silent) return p;
    }
    return Probe::Silent;
}


// -------- public API --------

Result<LinkConfig> discover_link(transport::ISerialChannel& channel,
                                 const std::string& path,
                                 const DiscoveryOptions& options,
                                 IReporter& reporter) {
    if (path.empty())
        return Result<LinkConfig>::failure(Status::InvalidArgument, "empty device path");
    if (options.baud_rates.empty() || options.line_states.empty())
        return Result<LinkConfig>::failure(Status::InvalidArgument, "empty candidate grid");

    for (uint32_t baud : options.baud_rates) {
        for (const auto& ls : options.line_states) {
            if (try_candidate(channel, path, baud, ls, options, reporter) != Probe::Answered)
                continue;

            reporter.info("link_found", where(path, baud, ls));
            return Result<LinkConfig>::success(LinkConfig{baud, ls.dtr, ls.rts});
        }
    }

    reporter.warn("link_not_found", {{"port", path},
                                     {"candidates", options.baud_rates.size() * options.line_states.size()}});
    return Result<LinkConfig>::failure(Status::ConfigurationNotFound,
                                       "no response on " + path);
}

} // namespace ssplink

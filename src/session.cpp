// ============================================================================
// session.cpp - implementation for session.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file session.cpp
 */

#include "ssplink/session.hpp"

#include <utility>

namespace ssplink {

// -------- helpers --------

static SessionReport& stop(SessionReport& r, Status s, std::string why, IReporter& rep) {
    r.status = s;
    r.detail = std::move(why);
    rep.error("session_failed", {{"status", to_string(s)}, {"reason", r.detail}});
    return r;
}

/*
 * ensure_access()
 * ---------------
 * Never stops the run: a denied port is reported, optionally remediated, and
 * the open() in discovery has the final word.
 */
static bool ensure_access(const SessionDeps& deps, const std::string& path, IReporter& rep) {
    if (deps.access.check(path) == Status::Ok) return true;

    rep.error("access_denied", {{"port", path}});
    if (deps.remediator) {
        if (deps.remediator->remediate(path, rep) == Status::Ok &&
            deps.access.check(path) == Status::Ok) {
            rep.info("access_restored", {{"port", path}});
            return true;
        }
        rep.error("remediation_incomplete", {{"port", path}});
    }
    for (const auto& step : manual_remediation_steps(path))
        rep.info("access_hint", {{"run", step}});
    return false;
}

static std::string emit_rule(const ProbeOptions& opt, IReporter& rep) {
    auto written = write_udev_rule(opt.rule_path, render_udev_rule(opt.vid, opt.pid));
    if (!written) {
        rep.error("udev_rule_failed", {{"path", opt.rule_path}, {"reason", written.detail}});
        return {};
    }
    rep.info("udev_rule_written", {{"path", opt.rule_path}});
    for (const auto& step : *written) rep.info("udev_rule_install", {{"run", step}});
    return opt.rule_path;
}


// -------- public API --------

SessionReport run_session(const SessionDeps& deps, const ProbeOptions& options,
                          IReporter& reporter) {
    SessionReport report;
    reporter.info("session_start", {{"vid", hex16(options.vid)}, {"pid", hex16(options.pid)}});

    // 1) locate the port
    if (!options.device_path.empty()) {
        report.dev_path = options.device_path;
        reporter.info("device_explicit", {{"port", report.dev_path}});
    } else {
        auto port = select_device(deps.ports.list_ports(), options.vid, options.pid, reporter);
        if (!port) return stop(report, port.status, port.detail, reporter);
        report.dev_path = port->dev_path;
        report.port     = *port;
    }

    // 2) permissions (non-fatal)
    report.access_ok = ensure_access(deps, report.dev_path, reporter);

    // 3) host artifact (non-fatal)
    if (options.emit_rule) report.rule_path = emit_rule(options, reporter);

    // 4) link discovery
    auto link = discover_link(deps.channel, report.dev_path, options.discovery, reporter);
    if (!link) return stop(report, link.status, link.detail, reporter);
    report.link = *link;

    // 5) bring-up sequence
    auto seq = run_sequence(deps.channel, report.dev_path, *link, options.sequence, reporter);
    if (seq.value) report.outcomes = std::move(seq.value->outcomes);
    if (!seq) return stop(report, seq.status, seq.detail, reporter);

    reporter.info("session_done", {{"port", report.dev_path},
                                   {"baud", static_cast<unsigned>(link->baud)},
                                   {"dtr", link->dtr}, {"rts", link->rts}});
    return report;
}

} // namespace ssplink

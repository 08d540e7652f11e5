#pragma once
/**
 * @page ssp-session ssplink Probe Session
 * @file session.hpp
 * @brief One full run: find the port, check access, emit the udev rule,
 *        discover the link, run the command sequence.
 *
 * @details
 * FLOW
 * ----
 *   [enumerator] -> select_device() ----------------> DeviceNotFound (stop)
 *   [access]     -> check()  -> optional remediator -> logged, never fatal
 *   udev rule    -> render + write to scratch path  -> logged, never fatal
 *   discover_link()  -------------------------------> ConfigurationNotFound (stop)
 *   run_sequence()   -------------------------------> TransportFault (stop)
 *                                                     Ok
 *
 * Everything the run touches on the host comes in through SessionDeps, so the
 * whole flow runs in tests against a scripted channel and a canned port list.
 *
 * The report keeps whatever was learned before a stop (port, link), which is
 * what ssplink-probe prints with --json.
 *
 * @author Leo
 */

#include "ssplink/access.hpp"
#include "ssplink/discovery.hpp"
#include "ssplink/port_scan.hpp"
#include "ssplink/reporter.hpp"
#include "ssplink/sequencer.hpp"
#include "ssplink/status.hpp"
#include "ssplink/transport/transport_base.hpp"
#include "ssplink/udev_rule.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ssplink {

/// Run-time knobs; defaults reproduce the stock probe.
struct ProbeOptions {
    std::string      device_path;                 ///< non-empty: skip enumeration
    uint16_t         vid = TARGET_VID;
    uint16_t         pid = TARGET_PID;
    DiscoveryOptions discovery;
    SequenceOptions  sequence;
    bool             emit_rule = true;
    std::string      rule_path = UDEV_RULE_TMP_PATH;
};

/// Host capabilities a session uses. remediator may be null (report only).
struct SessionDeps {
    IPortEnumerator&           ports;
    transport::ISerialChannel& channel;
    const IAccessChecker&      access;
    IPermissionRemediator*     remediator;
};

struct SessionReport {
    Status                      status{Status::Ok};
    std::string                 detail;
    std::optional<PortInfo>     port;
    std::string                 dev_path;
    bool                        access_ok{false};
    std::string                 rule_path;        ///< empty if not written
    std::optional<LinkConfig>   link;
    std::vector<CommandOutcome> outcomes;
};

SessionReport run_session(const SessionDeps& deps, const ProbeOptions& options,
                          IReporter& reporter);

} // namespace ssplink

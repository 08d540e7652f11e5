/**
 * @file main.cpp
 * @brief ssplink-probe - find a SMART Hopper 3, discover its link settings, run the bring-up.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) into ssplink::ProbeOptions.
 *  - Wire the Linux implementations (sysfs enumerator, termios channel,
 *    access(2) checker, optional sudo remediator) into run_session().
 *  - Log events to stderr as key=value lines; with --json print the run
 *    summary on stdout.
 *  - Exit with ssplink::exit_code(status): 0 only when the whole run worked.
 *
 * Notes:
 *  - --dev skips enumeration entirely; --vid/--pid are then only used for the
 *    udev rule.
 *  - --baud may be repeated; the order given is the order tried.
 */

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "ssplink/access.hpp"
#include "ssplink/port_scan.hpp"
#include "ssplink/reporter.hpp"
#include "ssplink/session.hpp"
#include "ssplink/session_json.hpp"
#include "ssplink/transport/transport_linux_serial.hpp"

using namespace ssplink;

// ---------- small utilities ----------

// Accepts "191c", "0x191c" or "0X191C".
static bool parse_hex16(const std::string& s, uint16_t& out) {
  if (s.empty()) return false;
  char* end = nullptr;
  unsigned long v = std::strtoul(s.c_str(), &end, 16);
  if (*end != '\0' || v > 0xFFFF) return false;
  out = static_cast<uint16_t>(v);
  return true;
}

int main(int argc, char** argv) {
  CLI::App app{"ssplink-probe: SMART Hopper 3 link discovery"};

  ProbeOptions opt;
  std::string vid_str = hex16(TARGET_VID);
  std::string pid_str = hex16(TARGET_PID);
  std::vector<uint32_t> bauds = opt.discovery.baud_rates;
  bool no_rule = false, fix_perms = false, as_json = false, verbose = false, quiet = false;

  // ---- targeting ----
  app.add_option("--dev", opt.device_path, "Serial device; skips USB enumeration");
  app.add_option("--vid", vid_str, "USB vendor id (hex)")->capture_default_str();
  app.add_option("--pid", pid_str, "USB product id (hex)")->capture_default_str();

  // ---- discovery / io tuning ----
  app.add_option("--baud", bauds,
                 "Candidate baud rate (repeatable, tried in order; default 9600 19200 38400 115200)");
  app.add_option("--settle-ms", opt.discovery.settle_ms, "Delay after setting DTR/RTS (ms)")
     ->check(CLI::Range(0, 60000))->capture_default_str();
  app.add_option("--delay-ms", opt.sequence.delay_ms, "Delay between command write and read (ms)")
     ->check(CLI::Range(0, 60000))->capture_default_str();
  int timeout_ms = opt.discovery.read_timeout_ms;
  app.add_option("--timeout-ms", timeout_ms, "Read timeout (ms)")
     ->check(CLI::Range(1, 60000))->capture_default_str();
  size_t read_max = opt.discovery.read_max;
  app.add_option("--read-max", read_max, "Bytes to read per response")
     ->check(CLI::Range(1, 4096))->capture_default_str();
  app.add_option("--extra-polls", opt.sequence.extra_polls, "Follow-up POLLs after an answered POLL")
     ->check(CLI::Range(0, 127))->capture_default_str();

  // ---- host side ----
  app.add_option("--rule-out", opt.rule_path, "Where to write the udev rule")->capture_default_str();
  app.add_flag("--no-rule", no_rule, "Do not write the udev rule");
  app.add_flag("--fix-perms", fix_perms, "Run sudo usermod/chmod when the port is not accessible");

  // ---- output ----
  app.add_flag("--json", as_json, "Print a JSON summary on stdout");
  auto* v_opt = app.add_flag("-v,--verbose", verbose, "Log packets and debug events");
  app.add_flag("-q,--quiet", quiet, "Only log warnings and errors")->excludes(v_opt);

  CLI11_PARSE(app, argc, argv);

  if (!parse_hex16(vid_str, opt.vid) || !parse_hex16(pid_str, opt.pid)) {
    std::cerr << "status=error reason=bad_vid_pid vid=" << vid_str << " pid=" << pid_str << "\n";
    return exit_code(Status::InvalidArgument);
  }
  if (bauds.empty()) {
    std::cerr << "status=error reason=no_baud_rates\n";
    return exit_code(Status::InvalidArgument);
  }

  opt.discovery.baud_rates      = bauds;
  opt.discovery.read_timeout_ms = timeout_ms;
  opt.discovery.read_max        = read_max;
  opt.sequence.read_timeout_ms  = timeout_ms;
  opt.sequence.read_max         = read_max;
  opt.emit_rule                 = !no_rule;

  StreamReporter reporter(std::cerr, verbose ? Level::Debug : quiet ? Level::Warn : Level::Info);

  SysfsPortEnumerator ports;
  transport::LinuxSerialChannel channel;
  PosixAccessChecker access;
  SudoRemediator sudo;

  SessionDeps deps{ports, channel, access, fix_perms ? &sudo : nullptr};
  SessionReport report = run_session(deps, opt, reporter);

  if (as_json) std::cout << report_to_json(report).dump(2) << "\n";
  return exit_code(report.status);
}

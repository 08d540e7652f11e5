#pragma once
/**
 * @file session_json.hpp
 * @brief Machine-readable run summary for `ssplink-probe --json`.
 *
 * Shape:
 * @code
 *   {
 *     "status": "ok", "exit_code": 0, "detail": "",
 *     "port": { "dev_path": "/dev/ttyUSB0", "vid": "191c", "pid": "4104", ... },
 *     "access_ok": true, "udev_rule": "/tmp/99-smarthopper.rules",
 *     "link": { "baud": 19200, "dtr": false, "rts": false },
 *     "commands": [ { "command": "SYNC", "opcode": 17, "seq": 128,
 *                     "extra_poll": 0, "response": true, "crc_ok": true,
 *                     "rx": "7f8001f0..." }, ... ]
 *   }
 * @endcode
 * "port" and "link" are null when the run stopped before learning them.
 */

#include "ssplink/session.hpp"

#include "nlohmann/json.hpp"

namespace ssplink {

nlohmann::json report_to_json(const SessionReport& report);

} // namespace ssplink

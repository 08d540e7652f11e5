#pragma once
/**
 * @page ssp-discovery ssplink Link Discovery
 * @file discovery.hpp
 * @brief Brute-force search for the baud rate and DTR/RTS levels a device answers on.
 *
 * @details
 * PURPOSE
 * -------
 * The hopper does not document which baud rate it boots at, and some units only
 * wake up after a particular DTR/RTS combination. Rather than guess, we walk a
 * small fixed grid and keep the first cell where anything comes back.
 *
 * SEARCH ORDER
 * ------------
 *   for baud in {9600, 19200, 38400, 115200}:          (outer)
 *     for (dtr, rts) in {(0,0), (1,0), (0,1), (1,1)}:  (inner)
 *       open port at baud, 8N1, 2 s read timeout
 *       drive DTR/RTS, wait 500 ms for the device to notice
 *       flush, send SYNC (seq 0x80), read up to 64 bytes  -> any byte: accept
 *       flush, send RESET (seq 0x80), read up to 64 bytes -> any byte: accept
 *       close port
 *
 * 16 candidates, at most 2 probe packets each. The port is closed before the
 * next candidate is opened, including when a candidate is accepted or faults.
 *
 * FAILURE HANDLING
 * ----------------
 * A candidate that cannot be opened, or whose ioctl/write/read fails, is logged
 * with port/baud/line context and counted as silent. The search moves on.
 * Running out of candidates is Status::ConfigurationNotFound, not a fault.
 *
 * EXAMPLE
 * -------
 * @code
 *   ssplink::transport::LinuxSerialChannel ch;
 *   ssplink::StreamReporter rep(std::cerr);
 *   auto link = ssplink::discover_link(ch, "/dev/ttyUSB0", {}, rep);
 *   if (link) std::cout << link->baud << "\n";
 * @endcode
 *
 * @author Leo
 */

#include "ssplink/reporter.hpp"
#include "ssplink/status.hpp"
#include "ssplink/transport/transport_base.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ssplink {

/// DTR/RTS levels for one candidate.
struct LineState {
    bool dtr{false};
    bool rts{false};
};

/// Working link parameters. Fixed once discovery returns it.
struct LinkConfig {
    uint32_t baud{0};
    bool     dtr{false};
    bool     rts{false};
};

inline bool operator==(const LinkConfig& a, const LinkConfig& b) {
    return a.baud == b.baud && a.dtr == b.dtr && a.rts == b.rts;
}
inline bool operator!=(const LinkConfig& a, const LinkConfig& b) { return !(a == b); }

static constexpr int    DEFAULT_SETTLE_MS       = 500;
static constexpr int    DEFAULT_READ_TIMEOUT_MS = 2000;
static constexpr size_t DEFAULT_READ_MAX        = 64;

/// {9600, 19200, 38400, 115200}
std::vector<uint32_t> default_baud_rates();

/// {(0,0), (1,0), (0,1), (1,1)} as (dtr, rts).
std::vector<LineState> default_line_states();

struct DiscoveryOptions {
    std::vector<uint32_t>  baud_rates      = default_baud_rates();
    std::vector<LineState> line_states     = default_line_states();
    int                    settle_ms       = DEFAULT_SETTLE_MS;
    int                    read_timeout_ms = DEFAULT_READ_TIMEOUT_MS;
    size_t                 read_max        = DEFAULT_READ_MAX;
};

/// 8N1 SerialConfig for one candidate.
transport::SerialConfig make_serial_config(const std::string& path, uint32_t baud,
                                           int read_timeout_ms);

/**
 * @brief Walk baud rates x line states and return the first one that answers.
 *
 * @return LinkConfig on success; ConfigurationNotFound once every candidate
 *         stayed silent or faulted; InvalidArgument for an empty path or grid.
 */
Result<LinkConfig> discover_link(transport::ISerialChannel& channel,
                                 const std::string& path,
                                 const DiscoveryOptions& options,
                                 IReporter& reporter);

} // namespace ssplink

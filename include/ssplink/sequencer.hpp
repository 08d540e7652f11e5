#pragma once
/**
 * @file sequencer.hpp
 * @brief Runs the SYNC -> SETUP_REQUEST -> ENABLE -> POLL bring-up over a known link.
 *
 * Each command goes out with the current sequence byte, then we wait the
 * inter-command delay and read whatever comes back. Responses are recorded,
 * not interpreted. The counter advances after every command whether or not
 * the device answered.
 *
 * When POLL gets an answer, `extra_polls` more POLL packets follow at
 * sequence offsets +1, +2, ... from the POLL's own sequence byte. A silent
 * extra poll does not stop the rest.
 *
 * Unlike discovery, a transport failure here ends the run with
 * Status::TransportFault.
 */

#include "ssplink/discovery.hpp"
#include "ssplink/frame.hpp"
#include "ssplink/reporter.hpp"
#include "ssplink/status.hpp"
#include "ssplink/transport/transport_base.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ssplink {

struct CommandDescriptor {
    uint8_t     opcode;
    const char* name;
};

/// SYNC, SETUP_REQUEST, ENABLE, POLL.
std::vector<CommandDescriptor> default_command_sequence();

static constexpr int      DEFAULT_COMMAND_DELAY_MS = 500;
static constexpr unsigned DEFAULT_EXTRA_POLLS      = 3;

struct SequenceOptions {
    std::vector<CommandDescriptor> commands        = default_command_sequence();
    int                            delay_ms        = DEFAULT_COMMAND_DELAY_MS;
    int                            read_timeout_ms = DEFAULT_READ_TIMEOUT_MS;
    size_t                         read_max        = DEFAULT_READ_MAX;
    unsigned                       extra_polls     = DEFAULT_EXTRA_POLLS;
};

/// What happened to one packet we sent.
struct CommandOutcome {
    uint8_t              opcode{0};
    std::string          name;
    uint8_t              sequence{0};
    unsigned             extra_poll{0};    ///< 0 for the main sequence, 1..N for follow-up polls
    bool                 responded{false};
    bool                 crc_ok{false};    ///< response parsed as one valid frame
    std::vector<uint8_t> response;
};

struct SequenceReport {
    std::vector<CommandOutcome> outcomes;
    uint8_t                     final_sequence{SEQ_FLAG};

    size_t responses() const;
};

/**
 * @brief Open the channel at `link`, run the command list, close the channel.
 *
 * @return The per-packet outcomes; TransportFault if the port could not be
 *         opened or any line/write/read operation failed along the way. A
 *         TransportFault still carries the outcomes gathered before it.
 */
Result<SequenceReport> run_sequence(transport::ISerialChannel& channel,
                                    const std::string& path,
                                    const LinkConfig& link,
                                    const SequenceOptions& options,
                                    IReporter& reporter);

} // namespace ssplink

// ============================================================================
// session_json.cpp - implementation for session_json.hpp
// ============================================================================

#include "ssplink/session_json.hpp"
#include "ssplink/frame.hpp"

using json = nlohmann::json;

namespace ssplink {

static json port_json(const PortInfo& p) {
    return json{
        {"dev_path",      p.dev_path},
        {"vid",           hex16(p.vid)},
        {"pid",           hex16(p.pid)},
        {"manufacturer",  p.manufacturer},
        {"description",   p.description},
        {"serial_number", p.serial_number},
        {"location",      p.location},
        {"interface",     p.interface}
    };
}

static json outcome_json(const CommandOutcome& o) {
    return json{
        {"command",    o.name},
        {"opcode",     o.opcode},
        {"seq",        o.sequence},
        {"extra_poll", o.extra_poll},
        {"response",   o.responded},
        {"crc_ok",     o.crc_ok},
        {"rx",         to_hex(o.response)}
    };
}

json report_to_json(const SessionReport& report) {
    json j;
    j["status"]    = to_string(report.status);
    j["exit_code"] = exit_code(report.status);
    j["detail"]    = report.detail;
    j["dev_path"]  = report.dev_path;
    j["port"]      = report.port ? port_json(*report.port) : json(nullptr);
    j["access_ok"] = report.access_ok;
    j["udev_rule"] = report.rule_path;

    if (report.link) {
        j["link"] = json{{"baud", report.link->baud},
                         {"dtr",  report.link->dtr},
                         {"rts",  report.link->rts}};
    } else {
        j["link"] = nullptr;
    }

    j["commands"] = json::array();
    for (const auto& o : report.outcomes) j["commands"].push_back(outcome_json(o));
    return j;
}

} // namespace ssplink

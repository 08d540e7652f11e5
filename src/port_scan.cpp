// ============================================================================
// port_scan.cpp - implementation for port_scan.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file port_scan.cpp
 */

#include "ssplink/port_scan.hpp"

#include <algorithm>          // std::sort for stable output order
#include <cstdlib>            // std::strtoul for hex id files
#include <filesystem>         // std::filesystem for walking sysfs
#include <fstream>            // std::ifstream for attribute files
#include <system_error>       // std::error_code for non-throwing filesystem ops

namespace fs = std::filesystem;
namespace ssplink {

// How far above the tty's device node we look for the USB device directory.
static constexpr int MAX_PARENT_HOPS = 6;


// -------- helpers --------

/*
 * read_attr()
 * -----------
 * First line of a sysfs attribute file, trailing whitespace stripped.
 * Missing or unreadable files yield "".
 */
static std::string read_attr(const fs::path& p) {
    std::ifstream in(p);
    if (!in) return {};
    std::string line;
    std::getline(in, line);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r' ||
                             line.back() == ' '  || line.back() == '\t'))
        line.pop_back();
    return line;
}

static uint16_t read_hex16(const fs::path& p) {
    std::string s = read_attr(p);
    if (s.empty()) return 0;
    char* end = nullptr;
    unsigned long v = std::strtoul(s.c_str(), &end, 16);
    if (end == s.c_str() || v > 0xFFFF) return 0;
    return static_cast<uint16_t>(v);
}

static bool has_file(const fs::path& dir, const char* name) {
    std::error_code ec;
    return fs::exists(dir / name, ec);
}

/*
 * fill_usb()
 * ----------
 * Walk up from the tty's device directory. The first ancestor holding
 * bInterfaceNumber is the USB interface; the first holding idVendor is the
 * USB device. Anything else (platform UARTs) leaves the USB fields empty.
 */
static void fill_usb(const fs::path& device_dir, PortInfo& info) {
    fs::path dir = device_dir;
    bool have_iface = false;

    for (int hop = 0; hop <= MAX_PARENT_HOPS && !dir.empty(); ++hop) {
        if (!have_iface && has_file(dir, "bInterfaceNumber")) {
            have_iface     = true;
            info.location  = dir.filename().string();
            info.interface = read_attr(dir / "interface");
        }
        if (has_file(dir, "idVendor")) {
            info.vid           = read_hex16(dir / "idVendor");
            info.pid           = read_hex16(dir / "idProduct");
            info.manufacturer  = read_attr(dir / "manufacturer");
            info.description   = read_attr(dir / "product");
            info.serial_number = read_attr(dir / "serial");
            if (!have_iface) info.location = dir.filename().string();
            return;
        }
        if (dir == dir.parent_path()) break;
        dir = dir.parent_path();
    }
}


// -------- public API --------

std::vector<PortInfo> SysfsPortEnumerator::list_ports() {
    std::vector<PortInfo> result;
    std::error_code ec;

    fs::directory_iterator it(root_, ec);
    if (ec) return result;                                   // no sysfs: nothing to list

    for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        const fs::path dev_link = entry.path() / "device";
        if (!fs::exists(dev_link, ec)) continue;             // virtual tty (console, pty)

        fs::path device_dir = fs::canonical(dev_link, ec);
        if (ec) continue;

        PortInfo info;
        info.dev_path = (fs::path(dev_dir_) / name).string();
        fill_usb(device_dir, info);
        if (info.description.empty()) info.description = name;
        result.push_back(std::move(info));
    }

    std::sort(result.begin(), result.end(),
              [](const PortInfo& a, const PortInfo& b) { return a.dev_path < b.dev_path; });
    return result;
}


Result<PortInfo> select_device(const std::vector<PortInfo>& ports,
                               uint16_t vid, uint16_t pid,
                               IReporter& reporter) {
    for (const auto& p : ports) {
        if (p.vid != vid || p.pid != pid) continue;

        reporter.info("device_found", {{"port", p.dev_path},
                                       {"vid", hex16(p.vid)}, {"pid", hex16(p.pid)}});
        reporter.info("device_info", {{"manufacturer", p.manufacturer},
                                      {"description", p.description},
                                      {"serial", p.serial_number},
                                      {"location", p.location},
                                      {"interface", p.interface}});
        return Result<PortInfo>::success(p);
    }

    reporter.warn("device_not_found", {{"vid", hex16(vid)}, {"pid", hex16(pid)},
                                       {"ports_seen", ports.size()}});
    return Result<PortInfo>::failure(Status::DeviceNotFound,
                                     "no port with " + hex16(vid) + ":" + hex16(pid));
}

} // namespace ssplink

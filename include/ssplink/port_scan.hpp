#pragma once
/**
 * @page ssp-port-scan ssplink Port Scan
 * @file port_scan.hpp
 * @brief Enumerate serial ports with their USB identity and pick the hopper among them.
 *
 * @details
 * PURPOSE
 * -------
 * Before anything can be probed we need the /dev path of the device. USB
 * serial adapters come and go under different ttyUSB/ttyACM names, so we look
 * them up by vendor/product id instead of by name.
 *
 * WHAT THIS DOES
 * --------------
 * - IPortEnumerator::list_ports() returns every tty the host exposes that is
 *   backed by real hardware, with whatever USB metadata the kernel publishes.
 * - SysfsPortEnumerator reads that metadata from /sys/class/tty/<name>/device,
 *   walking up to the USB device directory for idVendor/idProduct,
 *   manufacturer, product and serial, and to the USB interface directory for
 *   the interface label.
 * - select_device() picks the first port matching the target VID/PID and logs
 *   its descriptive fields.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - No libudev: plain filesystem reads, same result on Debian, Fedora, Arch.
 * - Non-USB ports (ttyS*) are listed with vid = pid = 0 so they never match.
 * - Results are sorted by device path so repeated scans agree.
 *
 * @author Leo
 */

#include "ssplink/frame.hpp"     // hex16()
#include "ssplink/reporter.hpp"
#include "ssplink/status.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ssplink {

/// SMART Hopper 3 USB identity.
static constexpr uint16_t TARGET_VID = 0x191c;
static constexpr uint16_t TARGET_PID = 0x4104;

/**
 * @struct PortInfo
 * @brief One enumerated serial port.
 */
struct PortInfo {
    std::string dev_path;       /**< e.g. "/dev/ttyUSB0" */
    uint16_t    vid{0};
    uint16_t    pid{0};
    std::string manufacturer;
    std::string description;    /**< USB product string, or the tty name */
    std::string serial_number;
    std::string location;       /**< USB interface path, e.g. "1-1.2:1.0" */
    std::string interface;      /**< USB interface label, often empty */
};

class IPortEnumerator {
public:
    virtual ~IPortEnumerator() = default;
    virtual std::vector<PortInfo> list_ports() = 0;
};

/**
 * @brief Enumerates /sys/class/tty. The root is configurable so tests can
 *        point it at a fake tree.
 */
class SysfsPortEnumerator : public IPortEnumerator {
public:
    explicit SysfsPortEnumerator(std::string sys_class_tty = "/sys/class/tty",
                                 std::string dev_dir = "/dev")
    : root_(std::move(sys_class_tty)), dev_dir_(std::move(dev_dir)) {}

    std::vector<PortInfo> list_ports() override;

private:
    std::string root_;
    std::string dev_dir_;
};

/**
 * @brief First port whose VID/PID match, or DeviceNotFound.
 */
Result<PortInfo> select_device(const std::vector<PortInfo>& ports,
                               uint16_t vid, uint16_t pid,
                               IReporter& reporter);

} // namespace ssplink

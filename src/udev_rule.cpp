// ============================================================================
// udev_rule.cpp - implementation for udev_rule.hpp
// ============================================================================

/**
 * @file udev_rule.cpp
 */

#include "ssplink/udev_rule.hpp"
#include "ssplink/frame.hpp"   // hex16()

#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;
namespace ssplink {

std::string render_udev_rule(uint16_t vid, uint16_t pid) {
    std::string r;
    r += "# udev rule for SMART Hopper 3\n";
    r += "ACTION==\"add\", SUBSYSTEM==\"tty\", ";
    r += "ATTRS{idVendor}==\"" + hex16(vid) + "\", ";
    r += "ATTRS{idProduct}==\"" + hex16(pid) + "\", ";
    r += std::string("MODE=\"") + UDEV_MODE + "\", ";
    r += std::string("GROUP=\"") + UDEV_GROUP + "\", ";
    r += std::string("SYMLINK+=\"") + UDEV_SYMLINK + "\"\n";
    return r;
}


std::vector<std::string> udev_install_steps(const std::string& written_to) {
    return {
        "sudo cp " + written_to + " " + UDEV_RULE_INSTALL_PATH,
        "sudo udevadm control --reload-rules && sudo udevadm trigger"
    };
}


Result<std::vector<std::string>> write_udev_rule(const std::string& path,
                                                 const std::string& rule_text) {
    using R = Result<std::vector<std::string>>;
    if (path.empty()) return R::failure(Status::InvalidArgument, "empty rule path");

    const fs::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);   // non-throwing; check ec
        if (ec) return R::failure(Status::InvalidArgument, "rule dir: " + ec.message());
    }

    std::ofstream ofs(target, std::ios::trunc);
    if (!ofs) return R::failure(Status::InvalidArgument, "cannot open " + path);
    ofs << rule_text;
    ofs.close();
    if (!ofs) return R::failure(Status::InvalidArgument, "write failed for " + path);

    return R::success(udev_install_steps(path));
}

} // namespace ssplink

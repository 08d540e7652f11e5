#pragma once
/**
 * @file udev_rule.hpp
 * @brief Device-naming rule for the hopper: generated and written out, never installed.
 *
 * The rule gives the port a stable /dev/smarthopper symlink and opens it to
 * the dialout group. Installing it needs root, so we only write it to a
 * scratch path and hand back the commands an operator runs to install it.
 */

#include "ssplink/status.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ssplink {

static constexpr const char* UDEV_RULE_TMP_PATH     = "/tmp/99-smarthopper.rules";
static constexpr const char* UDEV_RULE_INSTALL_PATH = "/etc/udev/rules.d/99-smarthopper.rules";
static constexpr const char* UDEV_SYMLINK           = "smarthopper";
static constexpr const char* UDEV_MODE              = "0666";
static constexpr const char* UDEV_GROUP             = "dialout";

/// Comment line plus one ACTION=="add" rule matching vid/pid.
std::string render_udev_rule(uint16_t vid, uint16_t pid);

/// Commands that copy `written_to` into place and reload udev.
std::vector<std::string> udev_install_steps(const std::string& written_to);

/**
 * @brief Write rule text to path (replacing any previous file).
 * @return The install steps for that path, or InvalidArgument with the
 *         reason when the file cannot be written.
 */
Result<std::vector<std::string>> write_udev_rule(const std::string& path,
                                                 const std::string& rule_text);

} // namespace ssplink

#pragma once
/**
 * @file access.hpp
 * @brief Read/write permission check for the device node, and the opt-in fixer.
 *
 * The probe logic itself only ever learns "AccessDenied". Doing something about
 * it (group membership, chmod) is the front end's call, made through an
 * IPermissionRemediator it chooses to supply. Without one, the manual
 * commands are printed and the run carries on; open() will say the rest.
 */

#include "ssplink/reporter.hpp"
#include "ssplink/status.hpp"

#include <string>
#include <vector>

namespace ssplink {

class IAccessChecker {
public:
    virtual ~IAccessChecker() = default;
    /// Ok if the current user may read and write path, else AccessDenied.
    virtual Status check(const std::string& path) const = 0;
};

/// access(2) with R_OK | W_OK.
class PosixAccessChecker : public IAccessChecker {
public:
    Status check(const std::string& path) const override;
};

class IPermissionRemediator {
public:
    virtual ~IPermissionRemediator() = default;
    /// Best effort. Ok when every step succeeded, AccessDenied otherwise.
    virtual Status remediate(const std::string& path, IReporter& reporter) = 0;
};

/**
 * @brief Runs `sudo usermod -a -G dialout <user>` then `sudo chmod a+rw <path>`.
 *
 * Commands are spawned with posix_spawnp and waited for; no shell is involved.
 */
class SudoRemediator : public IPermissionRemediator {
public:
    Status remediate(const std::string& path, IReporter& reporter) override;
};

/// Shell lines an operator can run by hand to get access to path.
std::vector<std::string> manual_remediation_steps(const std::string& path);

/// Login name for the usermod step: $USER, then getpwuid(), then "$USER".
std::string current_user_name();

} // namespace ssplink

// ============================================================================
// access.cpp - implementation for access.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file access.cpp
 */

#include "ssplink/access.hpp"

#include <cerrno>             // errno after spawn/wait failures
#include <cstdlib>            // getenv for $USER
#include <cstring>            // strerror for human-readable errno

#include <pwd.h>              // getpwuid() fallback for the user name
#include <spawn.h>            // posix_spawnp
#include <sys/wait.h>         // waitpid
#include <unistd.h>           // access(), getuid()

extern char** environ;

namespace ssplink {

Status PosixAccessChecker::check(const std::string& path) const {
    return ::access(path.c_str(), R_OK | W_OK) == 0 ? Status::Ok : Status::AccessDenied;
}


std::string current_user_name() {
    if (const char* u = std::getenv("USER"); u && *u) return u;
    if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_name) return pw->pw_name;
    return "$USER";
}


std::vector<std::string> manual_remediation_steps(const std::string& path) {
    return {
        "sudo usermod -a -G dialout " + current_user_name(),
        "sudo chmod a+rw " + path,
        "then log out and back in so the group change applies"
    };
}


// -------- helpers --------

/*
 * run_command()
 * -------------
 * Spawn argv[0] from PATH, wait, and report a non-zero exit or spawn failure.
 */
static bool run_command(const std::vector<std::string>& args, IReporter& rep) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    std::string line;
    for (const auto& a : args) { if (!line.empty()) line += ' '; line += a; }

    pid_t pid = 0;
    int rc = ::posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        rep.error("remediation_spawn_failed", {{"cmd", line}, {"reason", std::strerror(rc)}});
        return false;
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        rep.error("remediation_wait_failed", {{"cmd", line}, {"reason", std::strerror(errno)}});
        return false;
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        rep.error("remediation_failed", {{"cmd", line},
                                         {"exit", WIFEXITED(status) ? WEXITSTATUS(status) : -1}});
        return false;
    }
    rep.info("remediation_ok", {{"cmd", line}});
    return true;
}


Status SudoRemediator::remediate(const std::string& path, IReporter& reporter) {
    bool ok = run_command({"sudo", "usermod", "-a", "-G", "dialout", current_user_name()}, reporter);
    ok = run_command({"sudo", "chmod", "a+rw", path}, reporter) && ok;
    return ok ? Status::Ok : Status::AccessDenied;
}

} // namespace ssplink

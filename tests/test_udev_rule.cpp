#include <doctest/doctest.h>
#include "ssplink/udev_rule.hpp"
#include "ssplink/port_scan.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

using namespace ssplink;
namespace fs = std::filesystem;

TEST_CASE("rendered rule matches on VID/PID and names the device") {
    const std::string rule = render_udev_rule(TARGET_VID, TARGET_PID);

    CHECK(rule.rfind("# ", 0) == 0);
    CHECK(rule.find("ACTION==\"add\", SUBSYSTEM==\"tty\"") != std::string::npos);
    CHECK(rule.find("ATTRS{idVendor}==\"191c\"") != std::string::npos);
    CHECK(rule.find("ATTRS{idProduct}==\"4104\"") != std::string::npos);
    CHECK(rule.find("MODE=\"0666\"") != std::string::npos);
    CHECK(rule.find("GROUP=\"dialout\"") != std::string::npos);
    CHECK(rule.find("SYMLINK+=\"smarthopper\"") != std::string::npos);
    CHECK(rule.back() == '\n');
}

TEST_CASE("write_udev_rule writes the file and returns install steps") {
    const fs::path dir = fs::temp_directory_path() / ("ssplink-rule-" + std::to_string(::getpid()));
    const fs::path path = dir / "sub" / "99-smarthopper.rules";
    fs::remove_all(dir);

    const std::string text = render_udev_rule(0x191c, 0x4104);
    auto r = write_udev_rule(path.string(), text);

    REQUIRE(r.ok());
    REQUIRE(r->size() == 2);
    CHECK((*r)[0] == "sudo cp " + path.string() + " /etc/udev/rules.d/99-smarthopper.rules");
    CHECK((*r)[1].find("udevadm control --reload-rules") != std::string::npos);

    std::ifstream in(path);
    std::stringstream ss; ss << in.rdbuf();
    CHECK(ss.str() == text);

    fs::remove_all(dir);
}

TEST_CASE("write_udev_rule reports an unwritable path") {
    auto r = write_udev_rule("/proc/ssplink-cannot-write/99.rules", "x");
    CHECK_FALSE(r.ok());
    CHECK(r.status == Status::InvalidArgument);

    CHECK(write_udev_rule("", "x").status == Status::InvalidArgument);
}

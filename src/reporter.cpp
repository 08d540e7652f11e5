// ============================================================================
// reporter.cpp - implementation for reporter.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file reporter.cpp
 */

#include "ssplink/reporter.hpp"

#include <sstream>

namespace ssplink {

const char* to_string(Level lvl) {
    switch (lvl) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
    }
    return "info";
}

// Quote values that would otherwise break whitespace splitting.
static void append_value(std::ostringstream& os, const std::string& v) {
    if (!v.empty() && v.find_first_of(" \t\"") == std::string::npos) {
        os << v;
        return;
    }
    os << '"';
    for (char c : v) {
        if (c == '"' || c == '\\') os << '\\';
        os << c;
    }
    os << '"';
}

std::string format_line(Level lvl, const char* event, const Fields& fields) {
    std::ostringstream os;
    os << "level=" << to_string(lvl) << " event=" << (event ? event : "");
    for (const auto& f : fields) {
        os << ' ' << f.key << '=';
        append_value(os, f.value);
    }
    return os.str();
}

void StreamReporter::report(Level lvl, const char* event, const Fields& fields) {
    if (static_cast<uint8_t>(lvl) < static_cast<uint8_t>(min_)) return;
    os_ << format_line(lvl, event, fields) << '\n';
    os_.flush();
}

} // namespace ssplink

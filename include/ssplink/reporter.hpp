#pragma once
/**
 * @page ssp-reporter ssplink Reporter
 * @file reporter.hpp
 * @brief Injected event sink: one grep-friendly `key=value` line per event.
 *
 * @details
 * PURPOSE
 * -------
 * Every component (discovery, sequencer, session) takes an IReporter& instead of
 * writing to a global logger. Tests pass a recording reporter and inspect the
 * events; the CLI passes a StreamReporter bound to std::cerr.
 *
 * LINE FORMAT
 * -----------
 *   level=info event=probe port=/dev/ttyUSB0 baud=9600 dtr=false rts=false
 *   level=warn event=no_response command=SYNC seq=0x80
 *
 * Values containing spaces are double-quoted so the line stays splittable with
 * plain shell tools. Field order is the order the caller supplied.
 *
 * @author Leo
 */

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace ssplink {

enum class Level : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3 };

const char* to_string(Level lvl);

/// One key=value pair. Constructors cover the value types the components log.
struct Field {
    std::string key;
    std::string value;

    Field(std::string k, std::string v) : key(std::move(k)), value(std::move(v)) {}
    Field(std::string k, const char* v) : key(std::move(k)), value(v ? v : "") {}
    Field(std::string k, int v)         : key(std::move(k)), value(std::to_string(v)) {}
    Field(std::string k, unsigned v)    : key(std::move(k)), value(std::to_string(v)) {}
    Field(std::string k, unsigned long v) : key(std::move(k)), value(std::to_string(v)) {}
    Field(std::string k, unsigned long long v) : key(std::move(k)), value(std::to_string(v)) {}
    Field(std::string k, bool v)        : key(std::move(k)), value(v ? "true" : "false") {}
};

using Fields = std::vector<Field>;

/**
 * @brief Abstract event sink handed to every component.
 */
class IReporter {
public:
    virtual ~IReporter() = default;
    virtual void report(Level lvl, const char* event, const Fields& fields) = 0;

    void debug(const char* event, const Fields& f = {}) { report(Level::Debug, event, f); }
    void info (const char* event, const Fields& f = {}) { report(Level::Info,  event, f); }
    void warn (const char* event, const Fields& f = {}) { report(Level::Warn,  event, f); }
    void error(const char* event, const Fields& f = {}) { report(Level::Error, event, f); }
};

/**
 * @brief Writes formatted lines to an ostream, dropping events below min_level.
 */
class StreamReporter : public IReporter {
public:
    explicit StreamReporter(std::ostream& os, Level min_level = Level::Info)
    : os_(os), min_(min_level) {}

    void report(Level lvl, const char* event, const Fields& fields) override;

    void set_min_level(Level lvl) { min_ = lvl; }
    Level min_level() const { return min_; }

private:
    std::ostream& os_;
    Level min_;
};

/// Discards everything.
class NullReporter : public IReporter {
public:
    void report(Level, const char*, const Fields&) override {}
};

/// Render one event exactly as StreamReporter prints it (no trailing newline).
std::string format_line(Level lvl, const char* event, const Fields& fields);

} // namespace ssplink

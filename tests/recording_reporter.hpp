#pragma once
// IReporter that keeps every event for later inspection.

#include "ssplink/reporter.hpp"

#include <string>
#include <vector>

namespace ssplink::test {

struct Event {
  Level level;
  std::string name;
  Fields fields;

  std::string get(const std::string& key) const {
    for (const auto& f : fields) if (f.key == key) return f.value;
    return {};
  }
};

class RecordingReporter : public IReporter {
public:
  std::vector<Event> events;

  void report(Level lvl, const char* event, const Fields& fields) override {
    events.push_back({lvl, event, fields});
  }

  size_t count(const std::string& name) const {
    size_t n = 0;
    for (const auto& e : events) if (e.name == name) ++n;
    return n;
  }

  const Event* first(const std::string& name) const {
    for (const auto& e : events) if (e.name == name) return &e;
    return nullptr;
  }
};

} // namespace ssplink::test

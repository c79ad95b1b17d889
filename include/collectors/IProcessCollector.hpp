#pragma once
#include "model/Process.hpp"

namespace procstat::collectors {

// Interface for process collectors so the run loop can be driven by the
// /proc scanner or by a canned source in tests.
class IProcessCollector {
public:
  virtual ~IProcessCollector() = default;

  // Check the data source. Return false if unavailable (permissions, platform).
  // Default: available (no-op)
  [[nodiscard]] virtual bool init() { return true; }

  // Sample current process state into out. Return true on success.
  // May throw util::FatalError when the pass cannot produce meaningful rows.
  [[nodiscard]] virtual bool sample(procstat::model::ProcessSnapshot& out) = 0;

  // Optional: human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace procstat::collectors

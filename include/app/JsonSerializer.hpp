#pragma once

#include "app/Options.hpp"
#include "model/Process.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace procstat::app {

struct JsonReport {
  int64_t timestamp{};     // unix seconds
  double uptime_s{};
  size_t total_processes{}; // rows in the pass before ranking
  MemoryUnit unit{MemoryUnit::MB};
};

// Pretty-printed document:
// {"timestamp", "uptime", "total_processes", "processes": [{pid, ppid, cpu,
//  memory, command, state, time, type}, ...]}
[[nodiscard]] std::string snapshot_to_json(const std::vector<procstat::model::ProcessSample>& rows,
                                           const JsonReport& report);

} // namespace procstat::app

#include "ui/ProcessTable.hpp"

#include <cstdarg>
#include <cstdio>

namespace procstat::ui {

using procstat::app::MemoryUnit;
using procstat::model::ProcessSample;

// printf-style append; rows are short so one stack buffer covers them
[[gnu::format(printf, 2, 3)]]
static void appendf(std::string& out, const char* fmt, ...) {
  char buf[512];
  va_list ap;
  va_start(ap, fmt);
  int n = std::vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  if (n <= 0) return;
  if (static_cast<size_t>(n) < sizeof(buf)) { out.append(buf, static_cast<size_t>(n)); return; }
  std::string big(static_cast<size_t>(n) + 1, '\0');
  va_start(ap, fmt);
  std::vsnprintf(big.data(), big.size(), fmt, ap);
  va_end(ap);
  big.resize(static_cast<size_t>(n));
  out += big;
}

static void rule(std::string& out, char c) {
  out.append(static_cast<size_t>(kTableWidth), c);
  out += '\n';
}

std::string render_process_table(const std::vector<ProcessSample>& rows, MemoryUnit unit,
                                 bool show_summary, bool is_root) {
  std::string out;
  if (rows.empty()) {
    out += "No processes found or insufficient permissions.\n";
    if (!is_root) out += "Try running with sudo for more complete results.\n";
    return out;
  }

  const char* unit_name = procstat::app::memory_unit_name(unit);
  const std::string mem_label = std::string("MEM(") + unit_name + ")";
  appendf(out, "%-6s %-6s %-12s %-6s %s\n", "PID", "CPU%", mem_label.c_str(), "STATE", "COMMAND");
  rule(out, '-');

  double total_cpu = 0.0;
  double total_mem = 0.0;
  for (const auto& r : rows) {
    const double mem = procstat::app::memory_in_unit(r, unit);
    const std::string pid = r.is_thread() ? "  " + std::to_string(r.pid) : std::to_string(r.pid);
    const std::string state(1, r.state);
    const std::string command = r.is_thread() ? "  └─ " + r.command_line : r.command_line;
    appendf(out, "%-6s %-6.1f %-12.1f %-6s %s\n", pid.c_str(), r.cpu_pct, mem, state.c_str(), command.c_str());
    total_cpu += r.cpu_pct;
    total_mem += mem;
  }

  if (show_summary) {
    rule(out, '-');
    appendf(out, "Top %zu processes: %.1f%% CPU, %.1f %s\n", rows.size(), total_cpu, total_mem, unit_name);
  }
  return out;
}

std::string render_watch_header(int iteration, const std::string& local_time, double uptime_s,
                                const procstat::app::Options& opts) {
  std::string out;
  appendf(out, "Process Monitor - Iteration #%d - %s - Uptime: %.0fs\n", iteration, local_time.c_str(), uptime_s);

  std::string sort = procstat::app::sort_field_name(opts.sort);
  for (auto& c : sort) if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
  appendf(out, "Sorting by: %s | Showing top: %d | Refresh: %ds | Memory: %s", sort.c_str(), opts.limit,
          opts.interval_s, procstat::app::memory_unit_name(opts.unit));
  if (opts.include_zombies && opts.include_threads) out += " | Modes: Zombies, Threads";
  else if (opts.include_zombies) out += " | Modes: Zombies";
  else if (opts.include_threads) out += " | Modes: Threads";
  out += '\n';
  rule(out, '=');
  out += '\n';
  return out;
}

std::string render_total_entries(size_t total) {
  std::string out;
  appendf(out, "\nTotal entries displayed: %zu\n", total);
  return out;
}

} // namespace procstat::ui

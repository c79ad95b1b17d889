#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace procstat::model {

enum class RowKind { Process, Thread };

enum class SortField { CPU, MEM, PID, COMMAND, TIME };

// How CPU% is derived for one pass
enum class CpuMode {
  Auto,        // since-start on the first pass, delta afterwards
  SinceStart,  // ticks over the process lifetime
  Delta        // ticks since the previous sample of the same identity
};

struct ProcessSample {
  int32_t pid{};          // tid for thread rows
  int32_t ppid{};         // owning pid for thread rows
  char     state{'?'};
  std::string command_name;
  std::string command_line;
  double   cpu_pct{};     // 0..100, one decimal
  uint64_t rss_kb{};
  double   cpu_time_s{};  // one decimal
  uint64_t total_ticks{}; // utime+stime (+cutime+cstime for processes)
  RowKind  kind{RowKind::Process};

  [[nodiscard]] double memory_mb() const { return static_cast<double>(rss_kb) / 1024.0; }
  [[nodiscard]] bool is_thread() const { return kind == RowKind::Thread; }
};

struct ScanCounters {
  size_t scanned{};          // numeric /proc entries visited
  size_t errors{};           // entities skipped (vanished, unreadable, malformed)
  size_t zombies_skipped{};
  size_t cache_hits{};
  size_t threads{};          // thread rows produced
  size_t thread_caps{};      // processes whose thread listing hit the cap
  bool   scan_capped{false}; // max_scan reached before the listing ended
};

struct ProcessSnapshot {
  std::vector<ProcessSample> rows; // unranked
  ScanCounters counters{};
  double uptime_s{};
  double ticks_per_second{};
  CpuMode mode{CpuMode::SinceStart}; // mode actually used (never Auto)
  double elapsed_ms{};
};

} // namespace procstat::model

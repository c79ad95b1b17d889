#pragma once
#include "app/HistoryStore.hpp"
#include "collectors/IProcessCollector.hpp"
#include "collectors/PathValidator.hpp"
#include "collectors/SampleReader.hpp"
#include "collectors/SystemClock.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace procstat::app {

inline constexpr size_t kMaxThreadsPerProcess = 100;
inline constexpr size_t kMaxHistoryEntries = 1000000;
inline constexpr double kMinStaleSeconds = 5.0;

struct ScanOptions {
  bool include_zombies{false};
  bool include_threads{false};
  size_t thread_limit{1000};  // capped at kMaxThreadsPerProcess per process
  size_t max_scan{131072};    // numeric /proc entries visited per pass
  model::CpuMode cpu_mode{model::CpuMode::Auto};
  double refresh_interval_s{2.0}; // expected cadence, scales history staleness
  size_t batch_size{100};
  std::chrono::microseconds batch_pause{1000};
};

// Traditional /proc walk: one pass enumerates pids, reads each through the
// SampleReader, derives CPU% and feeds the history for the next pass.
class ProcessScanner : public collectors::IProcessCollector {
public:
  ProcessScanner(ScanOptions opts, const collectors::IClock& clock);
  // Explicit root (tests); default root comes from util::proc_root()
  ProcessScanner(ScanOptions opts, const collectors::IClock& clock, collectors::PathValidator validator);
  ProcessScanner(const ProcessScanner&) = delete;
  ProcessScanner& operator=(const ProcessScanner&) = delete;

  bool init() override { return validator_.root_available(); }
  const char* name() const override { return "Traditional /proc Scanner"; }
  bool sample(model::ProcessSnapshot& out) override;

  [[nodiscard]] const HistoryStore& history() const { return history_; }
  [[nodiscard]] const ScanOptions& options() const { return opts_; }

private:
  struct PassContext {
    double now{};
    double uptime{};
    double hz{};
    double pass_interval{};
    model::CpuMode mode{model::CpuMode::SinceStart};
  };

  [[nodiscard]] std::optional<model::ProcessSample> sample_process(int32_t pid, const PassContext& ctx,
                                                                   model::ScanCounters& counters);
  void sample_threads(const model::ProcessSample& owner, const PassContext& ctx,
                      std::vector<model::ProcessSample>& out,
                      model::ScanCounters& counters);
  [[nodiscard]] double derive_cpu(const Identity& id, uint64_t total_ticks,
                                  uint64_t start_ticks, const PassContext& ctx) const;
  [[nodiscard]] model::CpuMode resolve_mode() const;

  ScanOptions opts_;
  const collectors::IClock& clock_;
  collectors::PathValidator validator_;
  collectors::SampleReader reader_;
  HistoryStore history_;
  bool have_last_pass_{false};
  double last_pass_time_{0.0};
};

} // namespace procstat::app

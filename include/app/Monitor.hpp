#pragma once
#include "app/Options.hpp"
#include "collectors/IProcessCollector.hpp"
#include "model/Process.hpp"

#include <atomic>
#include <cstdio>
#include <memory>
#include <vector>

namespace procstat::app {

// Drives a process collector and renders its ranked rows, either once or
// in a refresh loop. Output goes to out, diagnostics to err.
class Monitor {
public:
  Monitor(Options opts, std::unique_ptr<collectors::IProcessCollector> collector,
          std::FILE* out = stdout, std::FILE* err = stderr);

  // One pass: sample, then rank. snap receives the unranked pass.
  // Returns false when the collector could not list processes at all.
  [[nodiscard]] bool collect(model::ProcessSnapshot& snap, std::vector<model::ProcessSample>& top);

  // Returns the process exit code
  int run_once();
  int run_watch(const std::atomic<bool>& stop);
  int run(const std::atomic<bool>& stop);

  [[nodiscard]] const Options& options() const { return opts_; }

private:
  void log_pass(const model::ProcessSnapshot& snap) const;
  void sleep_interval(const std::atomic<bool>& stop) const;
  void emit(const std::string& text) const;

  Options opts_;
  std::unique_ptr<collectors::IProcessCollector> collector_;
  std::FILE* out_;
  std::FILE* err_;
  bool logged_tick_rate_{false};
};

} // namespace procstat::app

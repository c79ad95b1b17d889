#include "app/Monitor.hpp"
#include "app/JsonSerializer.hpp"
#include "app/Ranker.hpp"
#include "ui/ProcessTable.hpp"
#include "ui/Terminal.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <string>
#include <thread>
#include <utility>
#include <unistd.h>

using namespace std::chrono;

namespace procstat::app {

static constexpr auto kSleepSlice = milliseconds(100);

static std::string local_time_string() {
  std::time_t t = std::time(nullptr);
  std::tm tm{};
  if (!::localtime_r(&t, &tm)) return {};
  char buf[32];
  size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return std::string(buf, n);
}

Monitor::Monitor(Options opts, std::unique_ptr<collectors::IProcessCollector> collector,
                 std::FILE* out, std::FILE* err)
  : opts_(std::move(opts)), collector_(std::move(collector)), out_(out), err_(err) {}

void Monitor::emit(const std::string& text) const {
  std::fwrite(text.data(), 1, text.size(), out_);
}

bool Monitor::collect(model::ProcessSnapshot& snap, std::vector<model::ProcessSample>& top) {
  top.clear();
  if (!collector_->sample(snap)) return false;
  top = top_n(snap.rows, opts_.sort, static_cast<size_t>(opts_.limit));
  return true;
}

void Monitor::log_pass(const model::ProcessSnapshot& snap) const {
  const auto& c = snap.counters;
  std::fprintf(err_, "procstat: debug: %zu scanned, %zu errors, %zu zombies skipped, %zu cached, %zu threads, took %.2f ms\n",
               c.scanned, c.errors, c.zombies_skipped, c.cache_hits, c.threads, snap.elapsed_ms);
  if (c.scan_capped)
    std::fprintf(err_, "procstat: debug: scan stopped at %ld entries (--max-scan)\n", opts_.max_scan);
  if (c.thread_caps)
    std::fprintf(err_, "procstat: debug: %zu processes hit the per-process thread cap\n", c.thread_caps);
}

int Monitor::run_once() {
  model::ProcessSnapshot snap;
  std::vector<model::ProcessSample> top;
  if (!collect(snap, top)) {
    std::fprintf(err_, "procstat: error: %s could not list processes, check permissions\n",
                 collector_->name());
    return 1;
  }
  if (opts_.verbose) {
    std::fprintf(err_, "procstat: debug: collector %s, tick rate %.0f Hz, cpu mode %s\n",
                 collector_->name(), snap.ticks_per_second, cpu_mode_name(snap.mode));
    log_pass(snap);
  }

  if (opts_.json) {
    JsonReport report;
    report.timestamp = static_cast<int64_t>(std::time(nullptr));
    report.uptime_s = snap.uptime_s;
    report.total_processes = snap.rows.size();
    report.unit = opts_.unit;
    emit(snapshot_to_json(top, report));
  } else {
    emit(procstat::ui::render_process_table(top, opts_.unit, true, ::geteuid() == 0));
    emit(procstat::ui::render_total_entries(snap.rows.size()));
  }
  std::fflush(out_);
  return 0;
}

void Monitor::sleep_interval(const std::atomic<bool>& stop) const {
  const auto deadline = steady_clock::now() + seconds(opts_.interval_s);
  while (!stop.load()) {
    auto now = steady_clock::now();
    if (now >= deadline) break;
    std::this_thread::sleep_for(std::min<steady_clock::duration>(kSleepSlice, deadline - now));
  }
}

int Monitor::run_watch(const std::atomic<bool>& stop) {
  std::fprintf(out_, "Process Monitor - Refresh every %ds (Ctrl+C to stop)\n", opts_.interval_s);
  std::fflush(out_);
  int iteration = 0;
  while (!stop.load()) {
    if (iteration++ > 0 && out_ == stdout && procstat::ui::tty_stdout()) procstat::ui::clear_screen();

    model::ProcessSnapshot snap;
    std::vector<model::ProcessSample> top;
    if (!collect(snap, top)) {
      std::fprintf(err_, "procstat: error: %s could not list processes, check permissions\n",
                   collector_->name());
      return 1;
    }
    if (opts_.verbose && !logged_tick_rate_) {
      std::fprintf(err_, "procstat: debug: collector %s, tick rate %.0f Hz\n", collector_->name(), snap.ticks_per_second);
      logged_tick_rate_ = true;
    }

    std::string frame = procstat::ui::render_watch_header(iteration, local_time_string(), snap.uptime_s, opts_);
    frame += procstat::ui::render_process_table(top, opts_.unit, false, ::geteuid() == 0);
    emit(frame);
    std::fflush(out_);

    sleep_interval(stop);
  }
  std::fprintf(out_, "\nShutting down...\n");
  std::fflush(out_);
  return 0;
}

int Monitor::run(const std::atomic<bool>& stop) {
  if (opts_.watch && !opts_.json) return run_watch(stop);
  return run_once();
}

} // namespace procstat::app

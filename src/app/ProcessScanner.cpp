#include "app/ProcessScanner.hpp"
#include "app/RateCalculator.hpp"
#include "util/Procfs.hpp"
#include "util/Text.hpp"

#include <algorithm>
#include <iterator>
#include <thread>

namespace procstat::app {

using procstat::model::CpuMode;
using procstat::model::ProcessSample;
using procstat::model::RowKind;

// Interval assumed for identities without history on a first delta pass
static constexpr double kFirstPassInterval = 1.0;
// History survives this many missed refreshes
static constexpr double kStaleIntervals = 3.0;

// Room for two passes of identities, so entries written this pass never
// push out the baselines the next pass needs
static size_t history_capacity(const ScanOptions& opts) {
  size_t per_pid = 1;
  if (opts.include_threads) per_pid += std::min(opts.thread_limit, kMaxThreadsPerProcess);
  const size_t per_pass = std::min(opts.max_scan, kMaxHistoryEntries) * per_pid;
  return std::min(per_pass * 2, kMaxHistoryEntries);
}

ProcessScanner::ProcessScanner(ScanOptions opts, const collectors::IClock& clock)
  : ProcessScanner(opts, clock, collectors::PathValidator{}) {}

ProcessScanner::ProcessScanner(ScanOptions opts, const collectors::IClock& clock, collectors::PathValidator validator)
  : opts_(opts), clock_(clock), validator_(std::move(validator)), reader_(validator_, opts.include_zombies),
    history_(history_capacity(opts)) {}

CpuMode ProcessScanner::resolve_mode() const {
  if (opts_.cpu_mode == CpuMode::Auto) return have_last_pass_ ? CpuMode::Delta : CpuMode::SinceStart;
  return opts_.cpu_mode;
}

double ProcessScanner::derive_cpu(const Identity& id, uint64_t total_ticks, uint64_t start_ticks,
                                  const PassContext& ctx) const {
  if (ctx.mode == CpuMode::SinceStart) {
    return cpu_percent_since_start(total_ticks, start_ticks, ctx.uptime, ctx.hz);
  }
  // Unseen identity: prior ticks 0 over the pass interval
  auto prior = history_.get(id);
  if (!prior) return cpu_percent(total_ticks, 0, ctx.pass_interval, ctx.hz);
  return cpu_percent(total_ticks, prior->total_ticks, ctx.now - prior->timestamp, ctx.hz);
}

std::optional<ProcessSample> ProcessScanner::sample_process(int32_t pid, const PassContext& ctx,
                                                            model::ScanCounters& counters) {
  const auto id = Identity::process(pid);
  if (auto cached = history_.cached_row(id, ctx.now)) {
    counters.cache_hits++;
    return cached;
  }
  auto rec = reader_.read_process_record(pid);
  if (!rec) {
    // Exited between listing and read, unreadable, or malformed
    counters.errors++;
    return std::nullopt;
  }
  if (rec->state == 'Z' && !opts_.include_zombies) {
    counters.zombies_skipped++;
    return std::nullopt;
  }

  const uint64_t total = rec->ticks_with_children();
  const double cpu = derive_cpu(id, total, rec->starttime, ctx);
  history_.put(id, total, ctx.now);

  ProcessSample ps;
  ps.pid = pid;
  ps.ppid = rec->ppid;
  ps.state = rec->state;
  ps.command_name = procstat::util::sanitize_printable(rec->name);
  ps.command_line = reader_.read_command_line(pid, rec->name);
  ps.rss_kb = reader_.read_rss_kb(pid);
  ps.cpu_pct = round_tenths(cpu);
  ps.cpu_time_s = round_tenths(static_cast<double>(total) / ctx.hz);
  ps.total_ticks = total;
  ps.kind = RowKind::Process;
  history_.cache_row(id, ps, ctx.now);
  return ps;
}

void ProcessScanner::sample_threads(const ProcessSample& owner, const PassContext& ctx,
                                    std::vector<ProcessSample>& out, model::ScanCounters& counters) {
  const size_t cap = std::min(opts_.thread_limit, kMaxThreadsPerProcess);
  size_t count = 0;
  for (int32_t tid : reader_.list_threads(owner.pid)) {
    if (tid == owner.pid) continue; // main thread is the process row
    if (count >= cap) {
      counters.thread_caps++;
      break;
    }
    const auto id = Identity::thread(owner.pid, tid);
    if (auto cached = history_.cached_row(id, ctx.now)) {
      counters.cache_hits++;
      out.push_back(std::move(*cached));
      ++count;
      continue;
    }
    auto rec = reader_.read_thread_record(owner.pid, tid);
    if (!rec) { counters.errors++; continue; }
    if (rec->state == 'Z' && !opts_.include_zombies) { counters.zombies_skipped++; continue; }

    const uint64_t total = rec->own_ticks();
    const double cpu = derive_cpu(id, total, rec->starttime, ctx);
    history_.put(id, total, ctx.now);

    ProcessSample ts;
    ts.pid = tid;
    ts.ppid = owner.pid;
    ts.state = rec->state;
    ts.command_name = procstat::util::sanitize_printable(rec->name);
    ts.command_line = procstat::util::truncate_display(ts.command_name);
    ts.rss_kb = owner.rss_kb; // threads share the owner's address space
    ts.cpu_pct = round_tenths(cpu);
    ts.cpu_time_s = round_tenths(static_cast<double>(total) / ctx.hz);
    ts.total_ticks = total;
    ts.kind = RowKind::Thread;
    history_.cache_row(id, ts, ctx.now);
    out.push_back(std::move(ts));
    ++count;
  }
}

bool ProcessScanner::sample(model::ProcessSnapshot& out) {
  const auto started = std::chrono::steady_clock::now();
  PassContext ctx;
  ctx.now = clock_.now_seconds();
  ctx.uptime = clock_.uptime_seconds();
  ctx.hz = clock_.ticks_per_second();
  if (!(ctx.hz > 0.0)) ctx.hz = collectors::kDefaultTicksPerSecond;
  ctx.mode = resolve_mode();
  ctx.pass_interval = have_last_pass_ ? (ctx.now - last_pass_time_) : kFirstPassInterval;

  out.rows.clear();
  out.counters = model::ScanCounters{};
  out.uptime_s = ctx.uptime;
  out.ticks_per_second = ctx.hz;
  out.mode = ctx.mode;
  out.elapsed_ms = 0.0;

  history_.evict_stale(ctx.now, std::max(kMinStaleSeconds, kStaleIntervals * opts_.refresh_interval_s));

  if (!validator_.root_available()) return false;
  auto names = procstat::util::list_dir(validator_.root());
  if (names.empty()) return false;

  std::vector<int32_t> pids;
  pids.reserve(std::min(names.size(), opts_.max_scan));
  for (const auto& name : names) {
    auto pid = collectors::PathValidator::parse_identity(name);
    if (!pid) continue;
    if (pids.size() >= opts_.max_scan) { out.counters.scan_capped = true; break; }
    pids.push_back(*pid);
  }
  out.counters.scanned = pids.size();

  out.rows.reserve(pids.size());
  for (size_t i = 0; i < pids.size(); ++i) {
    // Yield between batches so very large sweeps do not hog the host
    if (i > 0 && opts_.batch_size > 0 && i % opts_.batch_size == 0 && opts_.batch_pause.count() > 0) {
      std::this_thread::sleep_for(opts_.batch_pause);
    }
    if (auto row = sample_process(pids[i], ctx, out.counters)) out.rows.push_back(std::move(*row));
  }

  if (opts_.include_threads) {
    std::vector<ProcessSample> threads;
    const size_t nproc = out.rows.size();
    for (size_t i = 0; i < nproc; ++i) sample_threads(out.rows[i], ctx, threads, out.counters);
    out.counters.threads = threads.size();
    out.rows.insert(out.rows.end(), std::make_move_iterator(threads.begin()), std::make_move_iterator(threads.end()));
  }

  have_last_pass_ = true;
  last_pass_time_ = ctx.now;
  out.elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  return true;
}

} // namespace procstat::app

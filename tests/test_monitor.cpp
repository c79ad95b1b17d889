#include "minitest.hpp"
#include "app/Monitor.hpp"

#include <atomic>
#include <cstdio>
#include <memory>
#include <string>

using procstat::app::Monitor;
using procstat::app::Options;
using procstat::model::ProcessSample;
using procstat::model::ProcessSnapshot;
using procstat::model::SortField;

namespace {

// Serves the same canned pass every time
class CannedCollector : public procstat::collectors::IProcessCollector {
public:
  explicit CannedCollector(bool ok = true) : ok_(ok) {}
  int calls{0};

  bool sample(ProcessSnapshot& out) override {
    ++calls;
    if (!ok_) return false;
    out = ProcessSnapshot{};
    out.uptime_s = 500.0;
    out.ticks_per_second = 100.0;
    for (int pid : {10, 20, 30, 40}) {
      ProcessSample p;
      p.pid = pid;
      p.ppid = 1;
      p.state = 'S';
      p.cpu_pct = pid / 10.0;
      p.rss_kb = static_cast<uint64_t>(pid) * 1024;
      p.command_line = "proc" + std::to_string(pid);
      out.rows.push_back(p);
    }
    out.counters.scanned = 4;
    return true;
  }
  const char* name() const override { return "canned"; }

private:
  bool ok_;
};

struct Capture {
  std::FILE* out{std::tmpfile()};
  std::FILE* err{std::tmpfile()};
  ~Capture() {
    if (out) std::fclose(out);
    if (err) std::fclose(err);
  }
  static std::string read_all(std::FILE* f) {
    std::fflush(f);
    std::rewind(f);
    std::string s;
    char buf[1024];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) s.append(buf, n);
    return s;
  }
};

Options base_options() {
  Options o;
  o.limit = 2;
  o.sort = SortField::CPU;
  return o;
}

} // namespace

TEST(monitor_run_once_table) {
  Capture cap;
  ASSERT_TRUE(cap.out != nullptr && cap.err != nullptr);
  Monitor m(base_options(), std::make_unique<CannedCollector>(), cap.out, cap.err);
  ASSERT_EQ(m.run_once(), 0);
  auto out = Capture::read_all(cap.out);
  ASSERT_TRUE(out.contains("PID    CPU%"));
  ASSERT_TRUE(out.contains("proc40\n"));
  ASSERT_TRUE(out.contains("proc30\n"));
  ASSERT_TRUE(!out.contains("proc20"));
  ASSERT_TRUE(out.contains("Top 2 processes: 7.0% CPU, 70.0 MB\n"));
  ASSERT_TRUE(out.ends_with("\nTotal entries displayed: 4\n"));
  ASSERT_TRUE(Capture::read_all(cap.err).empty());
}

TEST(monitor_run_once_json) {
  Capture cap;
  auto o = base_options();
  o.json = true;
  o.watch = true; // ignored for json
  std::atomic<bool> stop{false};
  Monitor m(o, std::make_unique<CannedCollector>(), cap.out, cap.err);
  ASSERT_EQ(m.run(stop), 0);
  auto out = Capture::read_all(cap.out);
  ASSERT_TRUE(out.starts_with("{\n"));
  ASSERT_TRUE(out.contains("\"total_processes\": 4,"));
  ASSERT_TRUE(out.contains("\"uptime\": 500.00,"));
  ASSERT_TRUE(out.contains("\"pid\": 40,"));
  ASSERT_TRUE(!out.contains("\"pid\": 10,"));
  ASSERT_TRUE(!out.contains("Total entries"));
}

TEST(monitor_verbose_logs_to_err) {
  Capture cap;
  auto o = base_options();
  o.verbose = true;
  Monitor m(o, std::make_unique<CannedCollector>(), cap.out, cap.err);
  ASSERT_EQ(m.run_once(), 0);
  auto err = Capture::read_all(cap.err);
  ASSERT_TRUE(err.contains("procstat: debug: collector canned, tick rate 100 Hz"));
  ASSERT_TRUE(err.contains("4 scanned"));
}

TEST(monitor_collect_failure_exits_nonzero) {
  Capture cap;
  Monitor m(base_options(), std::make_unique<CannedCollector>(false), cap.out, cap.err);
  ASSERT_EQ(m.run_once(), 1);
  ASSERT_TRUE(Capture::read_all(cap.err).contains("procstat: error: canned could not list processes"));
  ASSERT_TRUE(Capture::read_all(cap.out).empty());
}

TEST(monitor_watch_stops_on_flag) {
  Capture cap;
  auto o = base_options();
  o.watch = true;
  o.interval_s = 3;
  auto collector = std::make_unique<CannedCollector>();
  auto* raw = collector.get();
  std::atomic<bool> stop{true};
  Monitor m(o, std::move(collector), cap.out, cap.err);
  ASSERT_EQ(m.run(stop), 0);
  ASSERT_EQ(raw->calls, 0);
  auto out = Capture::read_all(cap.out);
  ASSERT_TRUE(out.starts_with("Process Monitor - Refresh every 3s (Ctrl+C to stop)\n"));
  ASSERT_TRUE(out.ends_with("\nShutting down...\n"));
}

TEST(monitor_collect_ranks_top) {
  Capture cap;
  auto o = base_options();
  o.sort = SortField::PID;
  o.limit = 3;
  Monitor m(o, std::make_unique<CannedCollector>(), cap.out, cap.err);
  ProcessSnapshot snap;
  std::vector<ProcessSample> top;
  ASSERT_TRUE(m.collect(snap, top));
  ASSERT_EQ(snap.rows.size(), 4u);
  ASSERT_EQ(top.size(), 3u);
  ASSERT_EQ(top[0].pid, 40);
  ASSERT_EQ(top[2].pid, 20);
}

#include "app/Options.hpp"
#include "util/Text.hpp"

#include <charconv>
#include <cstdlib>
#include <string>

namespace procstat::app {

using procstat::model::CpuMode;
using procstat::model::SortField;

static constexpr std::string_view kSection = "procstat";

std::optional<SortField> parse_sort_field(std::string_view s) {
  auto v = procstat::util::ascii_lower(procstat::util::trim(s));
  if (v == "cpu") return SortField::CPU;
  if (v == "mem") return SortField::MEM;
  if (v == "pid") return SortField::PID;
  if (v == "command") return SortField::COMMAND;
  if (v == "time") return SortField::TIME;
  return std::nullopt;
}

const char* sort_field_name(SortField f) {
  switch (f) {
    case SortField::CPU: return "cpu";
    case SortField::MEM: return "mem";
    case SortField::PID: return "pid";
    case SortField::COMMAND: return "command";
    case SortField::TIME: return "time";
  }
  return "cpu";
}

std::optional<CpuMode> parse_cpu_mode(std::string_view s) {
  auto v = procstat::util::ascii_lower(procstat::util::trim(s));
  if (v == "auto") return CpuMode::Auto;
  if (v == "since-start" || v == "since_start" || v == "lifetime") return CpuMode::SinceStart;
  if (v == "delta" || v == "interval") return CpuMode::Delta;
  return std::nullopt;
}

const char* cpu_mode_name(CpuMode m) {
  switch (m) {
    case CpuMode::Auto: return "auto";
    case CpuMode::SinceStart: return "since-start";
    case CpuMode::Delta: return "delta";
  }
  return "auto";
}

const char* memory_unit_name(MemoryUnit u) { return u == MemoryUnit::KB ? "KB" : "MB"; }

double memory_in_unit(const model::ProcessSample& row, MemoryUnit unit) {
  return unit == MemoryUnit::KB ? static_cast<double>(row.rss_kb) : row.memory_mb();
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/procstat/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/procstat/config.toml";
  return {};
}

// Parse text as an integer and store it clamped to [lo, hi]. Unparseable
// text resets the field to def.
template <typename T>
static void assign_ranged(T& field, std::string_view text, T lo, T hi, T def,
                          std::string_view what, std::vector<std::string>& warnings) {
  auto t = procstat::util::trim(text);
  long long v = 0;
  auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), v);
  if (t.empty() || ptr != t.data() + t.size() || (ec != std::errc{} && ec != std::errc::result_out_of_range)) {
    warnings.push_back("invalid " + std::string(what) + " '" + std::string(t) + "', using " + std::to_string(def));
    field = def;
    return;
  }
  if (ec == std::errc::result_out_of_range) v = (!t.empty() && t.front() == '-') ? static_cast<long long>(lo) - 1
                                                                                   : static_cast<long long>(hi) + 1;
  if (v < static_cast<long long>(lo) || v > static_cast<long long>(hi)) {
    const T clamped = v < static_cast<long long>(lo) ? lo : hi;
    warnings.push_back(std::string(what) + " must be between " + std::to_string(lo) + " and " + std::to_string(hi) +
                       ", using " + std::to_string(clamped));
    field = clamped;
    return;
  }
  field = static_cast<T>(v);
}

static void assign_sort(Options& o, std::string_view text, std::vector<std::string>& warnings) {
  if (auto f = parse_sort_field(text)) { o.sort = *f; return; }
  warnings.push_back("invalid sort option '" + std::string(text) + "', using 'cpu'");
  o.sort = SortField::CPU;
}

static void assign_cpu_mode(Options& o, std::string_view text, std::vector<std::string>& warnings) {
  if (auto m = parse_cpu_mode(text)) { o.cpu_mode = *m; return; }
  warnings.push_back("invalid cpu mode '" + std::string(text) + "', using 'auto'");
  o.cpu_mode = CpuMode::Auto;
}

static void assign_unit(Options& o, std::string_view text, std::vector<std::string>& warnings) {
  auto v = procstat::util::ascii_lower(procstat::util::trim(text));
  if (v == "kb") { o.unit = MemoryUnit::KB; return; }
  if (v == "mb") { o.unit = MemoryUnit::MB; return; }
  warnings.push_back("invalid memory unit '" + std::string(text) + "', using 'MB'");
  o.unit = MemoryUnit::MB;
}

static std::optional<bool> parse_bool(std::string_view text) {
  auto v = procstat::util::ascii_lower(procstat::util::trim(text));
  if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
  if (v == "false" || v == "0" || v == "no" || v == "off") return false;
  return std::nullopt;
}

static void assign_bool(bool& field, std::string_view text, bool def, std::string_view what,
                        std::vector<std::string>& warnings) {
  if (auto b = parse_bool(text)) { field = *b; return; }
  warnings.push_back("invalid " + std::string(what) + " '" + std::string(text) + "', using " +
                     (def ? "true" : "false"));
  field = def;
}

void apply_config(Options& o, const util::TomlReader& toml, std::vector<std::string>& warnings) {
  auto str = [&](std::string_view key){ return toml.get_string(kSection, key); };
  if (toml.has(kSection, "limit"))
    assign_ranged(o.limit, str("limit"), kMinLimit, kMaxLimit, kDefaultLimit, "limit", warnings);
  if (toml.has(kSection, "sort")) assign_sort(o, str("sort"), warnings);
  if (toml.has(kSection, "watch")) assign_bool(o.watch, str("watch"), false, "watch", warnings);
  if (toml.has(kSection, "interval"))
    assign_ranged(o.interval_s, str("interval"), kMinInterval, kMaxInterval, kDefaultInterval, "interval", warnings);
  if (toml.has(kSection, "verbose")) assign_bool(o.verbose, str("verbose"), false, "verbose", warnings);
  if (toml.has(kSection, "zombie")) assign_bool(o.include_zombies, str("zombie"), false, "zombie", warnings);
  if (toml.has(kSection, "threads")) assign_bool(o.include_threads, str("threads"), false, "threads", warnings);
  if (toml.has(kSection, "thread_limit"))
    assign_ranged(o.thread_limit, str("thread_limit"), kMinThreadLimit, kMaxThreadLimit, kDefaultThreadLimit,
                  "thread limit", warnings);
  if (toml.has(kSection, "max_scan"))
    assign_ranged(o.max_scan, str("max_scan"), kMinMaxScan, kMaxMaxScan, kDefaultMaxScan, "max scan", warnings);
  if (toml.has(kSection, "memory_unit")) assign_unit(o, str("memory_unit"), warnings);
  if (toml.has(kSection, "json")) assign_bool(o.json, str("json"), false, "json", warnings);
  if (toml.has(kSection, "cpu_mode")) assign_cpu_mode(o, str("cpu_mode"), warnings);
}

static const char* getenv_nonempty(const char* name) {
  const char* v = std::getenv(name);
  return (v && *v) ? v : nullptr;
}

void apply_environment(Options& o, std::vector<std::string>& warnings) {
  if (const char* v = getenv_nonempty("PROCSTAT_LIMIT"))
    assign_ranged(o.limit, v, kMinLimit, kMaxLimit, kDefaultLimit, "limit", warnings);
  if (const char* v = getenv_nonempty("PROCSTAT_SORT")) assign_sort(o, v, warnings);
  if (const char* v = getenv_nonempty("PROCSTAT_INTERVAL"))
    assign_ranged(o.interval_s, v, kMinInterval, kMaxInterval, kDefaultInterval, "interval", warnings);
  if (const char* v = getenv_nonempty("PROCSTAT_VERBOSE")) {
    // Anything but an explicit false enables it
    o.verbose = !(v[0] == '0' || v[0] == 'f' || v[0] == 'F' || v[0] == 'n' || v[0] == 'N');
  }
  if (const char* v = getenv_nonempty("PROCSTAT_MAX_SCAN"))
    assign_ranged(o.max_scan, v, kMinMaxScan, kMaxMaxScan, kDefaultMaxScan, "max scan", warnings);
  if (const char* v = getenv_nonempty("PROCSTAT_CPU_MODE")) assign_cpu_mode(o, v, warnings);
}

void apply_args(Options& o, int argc, const char* const* argv, std::vector<std::string>& warnings) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-h" || a == "--help") { o.show_help = true; continue; }
    if (a.size() < 3 || a.rfind("--", 0) != 0) {
      warnings.push_back("unexpected argument '" + a + "' ignored");
      continue;
    }
    std::string name = a.substr(2);
    std::optional<std::string> value;
    if (auto eq = name.find('='); eq != std::string::npos) {
      value = name.substr(eq + 1);
      name.resize(eq);
    }
    // Options that need a value also accept it as the next argument
    auto take_value = [&]() -> std::optional<std::string> {
      if (value) return value;
      if (i + 1 < argc && std::string_view(argv[i + 1]).rfind("--", 0) != 0) return std::string(argv[++i]);
      warnings.push_back("option '--" + name + "' requires a value");
      return std::nullopt;
    };

    if (name == "limit") {
      if (auto v = take_value()) assign_ranged(o.limit, *v, kMinLimit, kMaxLimit, kDefaultLimit, "limit", warnings);
    } else if (name == "sort") {
      if (auto v = take_value()) assign_sort(o, *v, warnings);
    } else if (name == "watch") {
      o.watch = true;
      if (value) assign_ranged(o.interval_s, *value, kMinInterval, kMaxInterval, kDefaultInterval, "interval", warnings);
    } else if (name == "verbose") {
      o.verbose = true;
    } else if (name == "zombie") {
      o.include_zombies = true;
    } else if (name == "threads") {
      o.include_threads = true;
    } else if (name == "thread-limit") {
      if (auto v = take_value())
        assign_ranged(o.thread_limit, *v, kMinThreadLimit, kMaxThreadLimit, kDefaultThreadLimit, "thread limit", warnings);
    } else if (name == "max-scan") {
      if (auto v = take_value())
        assign_ranged(o.max_scan, *v, kMinMaxScan, kMaxMaxScan, kDefaultMaxScan, "max scan", warnings);
    } else if (name == "kb") {
      o.unit = MemoryUnit::KB;
    } else if (name == "mb") {
      o.unit = MemoryUnit::MB;
    } else if (name == "json") {
      o.json = true;
    } else if (name == "cpu-mode") {
      if (auto v = take_value()) assign_cpu_mode(o, *v, warnings);
    } else if (name == "config") {
      if (auto v = take_value()) o.config_path = *v;
    } else {
      warnings.push_back("unknown option '" + a + "' ignored");
    }
  }
}

// --config has to be known before the file layer is applied
static std::string find_config_arg(int argc, const char* const* argv) {
  std::string path;
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    if (a.rfind("--config=", 0) == 0) path = std::string(a.substr(9));
    else if (a == "--config" && i + 1 < argc) path = argv[++i];
  }
  return path;
}

Options load_options(int argc, const char* const* argv, std::vector<std::string>& warnings) {
  Options o;
  const std::string explicit_path = find_config_arg(argc, argv);
  const std::string path = explicit_path.empty() ? config_file_path() : explicit_path;
  if (!path.empty()) {
    util::TomlReader toml;
    if (toml.load(path)) {
      for (int line : toml.bad_lines())
        warnings.push_back(path + ":" + std::to_string(line) + ": unrecognized line ignored");
      apply_config(o, toml, warnings);
    } else if (!explicit_path.empty()) {
      warnings.push_back("cannot read config file '" + path + "'");
    }
  }
  apply_environment(o, warnings);
  apply_args(o, argc, argv, warnings);
  o.config_path = path;
  // Structured output is always a single pass
  if (o.json) o.watch = false;
  return o;
}

ScanOptions to_scan_options(const Options& o) {
  ScanOptions s;
  s.include_zombies = o.include_zombies;
  s.include_threads = o.include_threads;
  s.thread_limit = static_cast<size_t>(o.thread_limit);
  s.max_scan = static_cast<size_t>(o.max_scan);
  s.cpu_mode = o.cpu_mode;
  s.refresh_interval_s = static_cast<double>(o.interval_s);
  return s;
}

std::string usage_text(const char* prog) {
  std::string p = (prog && *prog) ? prog : "procstat";
  if (auto slash = p.rfind('/'); slash != std::string::npos) p = p.substr(slash + 1);
  std::string s;
  s += "Process Monitor - Linux Process Statistics\n";
  s += "Usage: " + p + " [OPTIONS]\n\n";
  s += "Options:\n";
  s += "  -h, --help            Show this help message\n";
  s += "      --limit=N         Show top N processes (default: 20, 1-1000)\n";
  s += "      --sort=TYPE       Sort by: cpu, mem, pid, command, time (default: cpu)\n";
  s += "      --watch[=N]       Refresh every N seconds (default: 2, 1-3600)\n";
  s += "      --verbose         Show debug information on stderr\n";
  s += "      --zombie          Include zombie processes\n";
  s += "      --threads         Show thread information\n";
  s += "      --thread-limit=N  Maximum threads per process (default: 1000, shown: at most 100)\n";
  s += "      --max-scan=N      Maximum PIDs to scan (default: 131072, 100-1000000)\n";
  s += "      --kb              Show memory in kilobytes\n";
  s += "      --mb              Show memory in megabytes (default)\n";
  s += "      --json            Output in JSON format (single pass)\n";
  s += "      --cpu-mode=MODE   CPU%: auto, since-start, delta (default: auto)\n";
  s += "      --config=PATH     Config file (default: " + std::string("$XDG_CONFIG_HOME/procstat/config.toml") + ")\n\n";
  s += "Environment: PROCSTAT_LIMIT, PROCSTAT_SORT, PROCSTAT_INTERVAL, PROCSTAT_VERBOSE,\n";
  s += "             PROCSTAT_MAX_SCAN, PROCSTAT_CPU_MODE, PROCSTAT_PROC_ROOT\n\n";
  s += "Examples:\n";
  s += "  " + p + " --limit=10 --sort=mem\n";
  s += "  " + p + " --watch=5 --threads\n";
  s += "  " + p + " --verbose --zombie --kb\n";
  s += "  " + p + " --limit=20 --sort=cpu --json\n\n";
  s += "Note: Some systems may require sudo/root privileges to read all process information.\n";
  return s;
}

} // namespace procstat::app

#pragma once
#include "app/ProcessScanner.hpp"
#include "model/Process.hpp"
#include "util/TomlReader.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace procstat::app {

enum class MemoryUnit { KB, MB };

inline constexpr int    kDefaultLimit = 20;
inline constexpr int    kMinLimit = 1, kMaxLimit = 1000;
inline constexpr int    kDefaultInterval = 2;
inline constexpr int    kMinInterval = 1, kMaxInterval = 3600;
inline constexpr int    kDefaultThreadLimit = 1000;
inline constexpr int    kMinThreadLimit = 1, kMaxThreadLimit = 10000;
inline constexpr long   kDefaultMaxScan = 131072;
inline constexpr long   kMinMaxScan = 100, kMaxMaxScan = 1000000;

// Resolved run configuration. Values are always within their ranges once
// produced by load_options().
struct Options {
  int limit{kDefaultLimit};
  model::SortField sort{model::SortField::CPU};
  bool watch{false};
  int interval_s{kDefaultInterval};
  bool verbose{false};
  bool include_zombies{false};
  bool include_threads{false};
  int thread_limit{kDefaultThreadLimit};
  long max_scan{kDefaultMaxScan};
  MemoryUnit unit{MemoryUnit::MB};
  bool json{false};
  model::CpuMode cpu_mode{model::CpuMode::Auto};
  std::string config_path;   // empty: default location
  bool show_help{false};
};

std::optional<model::SortField> parse_sort_field(std::string_view s);
const char* sort_field_name(model::SortField f);
std::optional<model::CpuMode> parse_cpu_mode(std::string_view s);
const char* cpu_mode_name(model::CpuMode m);
const char* memory_unit_name(MemoryUnit u);

// Row memory in the requested unit
double memory_in_unit(const model::ProcessSample& row, MemoryUnit unit);

// $XDG_CONFIG_HOME/procstat/config.toml, else ~/.config/procstat/config.toml
std::string config_file_path();

// Each layer overwrites what it sets and appends a message per rejected or
// clamped value to warnings.
void apply_config(Options& o, const util::TomlReader& toml, std::vector<std::string>& warnings);
void apply_environment(Options& o, std::vector<std::string>& warnings);
void apply_args(Options& o, int argc, const char* const* argv, std::vector<std::string>& warnings);

// Full resolution: defaults < config file < environment < command line.
Options load_options(int argc, const char* const* argv, std::vector<std::string>& warnings);

ScanOptions to_scan_options(const Options& o);

std::string usage_text(const char* prog);

} // namespace procstat::app

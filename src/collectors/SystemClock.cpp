#include "collectors/SystemClock.hpp"
#include "util/Error.hpp"
#include "util/Procfs.hpp"
#include "util/Text.hpp"

#include <unistd.h>

#include <charconv>
#include <cmath>
#include <filesystem>
#include <system_error>

namespace procstat::collectors {

static constexpr double kMinValidUptime = 0.00001;

SystemClock::SystemClock() : hz_(detect_ticks_per_second()), epoch_(std::chrono::steady_clock::now()) {}

double SystemClock::now_seconds() const {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - epoch_).count();
}

double SystemClock::detect_ticks_per_second() {
  long hz = ::sysconf(_SC_CLK_TCK);
  if (hz > 0) return static_cast<double>(hz);
  return kDefaultTicksPerSecond;
}

double SystemClock::parse_uptime(const std::string& content) {
  auto sv = procstat::util::trim(content);
  auto sp = sv.find_first_of(" \t");
  if (sp == std::string_view::npos) throw procstat::util::FatalError("invalid format in /proc/uptime");
  auto first = sv.substr(0, sp);
  double v = 0.0;
  auto [ptr, ec] = std::from_chars(first.data(), first.data() + first.size(), v);
  if (ec != std::errc{} || ptr != first.data() + first.size() || !std::isfinite(v) || v <= kMinValidUptime) {
    throw procstat::util::FatalError("invalid uptime value in /proc/uptime");
  }
  return v;
}

double SystemClock::uptime_seconds() const {
  auto txt = procstat::util::read_file_string(procstat::util::proc_root() + "/uptime");
  if (!txt) throw procstat::util::FatalError("cannot read /proc/uptime; check permissions or run with appropriate privileges");
  return parse_uptime(*txt);
}

void validate_proc_root() {
  namespace fs = std::filesystem;
  const auto root = procstat::util::proc_root();
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    throw procstat::util::FatalError(root + " not available or not mounted");
  }
  if (!fs::exists(root + "/self", ec) && !fs::exists(root + "/version", ec)) {
    throw procstat::util::FatalError(root + " does not appear to be a proc filesystem");
  }
  if (::access((root + "/uptime").c_str(), R_OK) != 0) {
    throw procstat::util::FatalError(root + "/uptime is not readable; check permissions or run with sudo");
  }
}

} // namespace procstat::collectors

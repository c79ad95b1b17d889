#include "app/RateCalculator.hpp"

#include <algorithm>
#include <cmath>

namespace procstat::app {

double clamp_percent(double pct) noexcept {
  if (!(pct > 0.0)) return 0.0; // also NaN
  return std::min(pct, 100.0);
}

double cpu_percent(uint64_t total_ticks, uint64_t prior_ticks,
                   double elapsed_seconds, double ticks_per_second) noexcept {
  if (!(ticks_per_second > 0.0)) return 0.0;
  uint64_t delta = (total_ticks > prior_ticks) ? (total_ticks - prior_ticks) : 0;
  double elapsed = std::max(elapsed_seconds, kElapsedEpsilon);
  if (!std::isfinite(elapsed)) return 0.0;
  double pct = 100.0 * (static_cast<double>(delta) / ticks_per_second) / elapsed;
  return clamp_percent(pct);
}

double cpu_percent_since_start(uint64_t total_ticks, uint64_t start_ticks,
                               double uptime_seconds, double ticks_per_second) noexcept {
  if (!(ticks_per_second > 0.0)) return 0.0;
  double elapsed = uptime_seconds - static_cast<double>(start_ticks) / ticks_per_second;
  if (!(elapsed > kMinElapsedSeconds)) return 0.0;
  return cpu_percent(total_ticks, 0, elapsed, ticks_per_second);
}

double round_tenths(double v) noexcept {
  return std::round(v * 10.0) / 10.0;
}

} // namespace procstat::app

#pragma once
#include <cstdint>

namespace procstat::app {

// Below this many seconds of process lifetime, since-start CPU% is 0
inline constexpr double kMinElapsedSeconds = 0.1;
// Lower bound on the delta-mode divisor
inline constexpr double kElapsedEpsilon = 0.00001;

// Clamp to [0,100]; NaN maps to 0
[[nodiscard]] double clamp_percent(double pct) noexcept;

// 100 * ((total - prior)/hz) / max(elapsed, epsilon), prior > total counts as 0.
[[nodiscard]] double cpu_percent(uint64_t total_ticks, uint64_t prior_ticks,
                                 double elapsed_seconds, double ticks_per_second) noexcept;

// Share of one CPU over the whole lifetime: elapsed = uptime - start/hz
[[nodiscard]] double cpu_percent_since_start(uint64_t total_ticks, uint64_t start_ticks,
                                             double uptime_seconds, double ticks_per_second) noexcept;

// Round half away from zero to one decimal
[[nodiscard]] double round_tenths(double v) noexcept;

} // namespace procstat::app

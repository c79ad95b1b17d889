#pragma once
#include <chrono>
#include <string>

namespace procstat::collectors {

inline constexpr double kDefaultTicksPerSecond = 100.0;

// Clock source for the sampling core. Tests substitute a manual clock.
class IClock {
public:
  virtual ~IClock() = default;

  // Monotonic seconds; only differences are meaningful
  [[nodiscard]] virtual double now_seconds() const = 0;

  // Seconds since boot. Throws util::FatalError when unavailable.
  [[nodiscard]] virtual double uptime_seconds() const = 0;

  [[nodiscard]] virtual double ticks_per_second() const = 0;
};

class SystemClock : public IClock {
public:
  SystemClock(); // detects the tick rate once
  [[nodiscard]] double now_seconds() const override;
  [[nodiscard]] double uptime_seconds() const override;
  [[nodiscard]] double ticks_per_second() const override { return hz_; }

  // sysconf(_SC_CLK_TCK), or kDefaultTicksPerSecond when undeterminable
  [[nodiscard]] static double detect_ticks_per_second();

  // First field of /proc/uptime. Throws util::FatalError.
  [[nodiscard]] static double parse_uptime(const std::string& content);

private:
  double hz_{kDefaultTicksPerSecond};
  std::chrono::steady_clock::time_point epoch_{};
};

// Throws util::FatalError if the (possibly remapped) /proc root is missing or
// does not look like a proc filesystem.
void validate_proc_root();

} // namespace procstat::collectors

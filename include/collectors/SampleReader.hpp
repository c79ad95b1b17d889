#pragma once
#include "collectors/PathValidator.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace procstat::collectors {

// Raw fields of one /proc/<pid>/stat or /proc/<pid>/task/<tid>/stat record
struct StatRecord {
  std::string name;     // between the first '(' and the last ')', unsanitized
  char     state{'?'};   // '?' when outside printable ASCII
  int32_t  ppid{};
  uint64_t utime{};     // ticks
  uint64_t stime{};
  uint64_t cutime{};
  uint64_t cstime{};
  uint64_t starttime{}; // ticks since boot

  [[nodiscard]] uint64_t own_ticks() const { return utime + stime; }
  [[nodiscard]] uint64_t ticks_with_children() const { return utime + stime + cutime + cstime; }
};

// Tokens required after the name: up to and including rss
inline constexpr size_t kMinStatFields = 22;

class SampleReader {
public:
  // With parse_zombies false, a record in state Z is returned as soon as its
  // state token is seen: name and state only, counters left at zero.
  explicit SampleReader(const PathValidator& validator, bool parse_zombies = true);

  [[nodiscard]] std::optional<StatRecord> read_process_record(int32_t pid) const;
  [[nodiscard]] std::optional<StatRecord> read_thread_record(int32_t pid, int32_t tid) const;

  // VmRSS from the status record; 0 when absent or unreadable
  [[nodiscard]] uint64_t read_rss_kb(int32_t pid) const;
  [[nodiscard]] double read_memory_mb(int32_t pid) const;

  // Sanitized, truncated argv; "[name]" for kernel threads and zombies
  [[nodiscard]] std::string read_command_line(int32_t pid, const std::string& name) const;

  // Numeric entries of /proc/<pid>/task, in directory order
  [[nodiscard]] std::vector<int32_t> list_threads(int32_t pid) const;

  [[nodiscard]] static std::optional<StatRecord> parse_stat_record(std::string_view content,
                                                              bool parse_zombies = true);
  [[nodiscard]] static uint64_t parse_vmrss_kb(std::string_view status);
  [[nodiscard]] static std::string format_command_line(const std::vector<unsigned char>& raw,
                                                       const std::string& name);

private:
  [[nodiscard]] std::string pid_path(int32_t pid, const char* leaf) const;
  [[nodiscard]] std::optional<std::string> read_gated(const std::string& path) const;

  const PathValidator& validator_;
  bool parse_zombies_;
};

} // namespace procstat::collectors

#include "collectors/SampleReader.hpp"
#include "util/Procfs.hpp"
#include "util/Text.hpp"

#include <charconv>

namespace procstat::collectors {

template <typename T>
static bool parse_num(std::string_view sv, T& out) {
  if (sv.empty()) return false;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  return ec == std::errc{} && ptr == sv.data() + sv.size();
}

static std::vector<std::string_view> split_ws(std::string_view sv) {
  std::vector<std::string_view> out;
  size_t i = 0;
  while (i < sv.size()) {
    while (i < sv.size() && (sv[i] == ' ' || sv[i] == '\t' || sv[i] == '\n')) ++i;
    size_t j = i;
    while (j < sv.size() && sv[j] != ' ' && sv[j] != '\t' && sv[j] != '\n') ++j;
    if (j > i) out.push_back(sv.substr(i, j - i));
    i = j;
  }
  return out;
}

static char printable_state(char c) {
  auto u = static_cast<unsigned char>(c);
  return (u < 0x20 || u > 0x7E) ? '?' : c;
}

SampleReader::SampleReader(const PathValidator& validator, bool parse_zombies)
  : validator_(validator), parse_zombies_(parse_zombies) {}

std::optional<StatRecord> SampleReader::parse_stat_record(std::string_view content, bool parse_zombies) {
  // The name may itself contain spaces and parentheses: take the LAST ')'
  auto lp = content.find('(');
  auto rp = content.rfind(')');
  if (lp == std::string_view::npos || rp == std::string_view::npos || rp < lp) return std::nullopt;

  StatRecord rec;
  rec.name = std::string(content.substr(lp + 1, rp - lp - 1));

  auto rest = content.substr(rp + 1);
  if (!parse_zombies && rest.size() >= 3 && rest[0] == ' ' && rest[1] == 'Z' &&
      (rest[2] == ' ' || rest[2] == '\n')) {
    rec.state = 'Z';
    return rec;
  }

  auto fields = split_ws(rest);
  if (fields.size() < kMinStatFields) return std::nullopt;
  if (fields[0].size() != 1) return std::nullopt;
  rec.state = printable_state(fields[0][0]);
  if (!parse_num(fields[1], rec.ppid)) return std::nullopt;
  if (!parse_num(fields[11], rec.utime)) return std::nullopt;
  if (!parse_num(fields[12], rec.stime)) return std::nullopt;
  if (!parse_num(fields[13], rec.cutime)) return std::nullopt;
  if (!parse_num(fields[14], rec.cstime)) return std::nullopt;
  if (!parse_num(fields[19], rec.starttime)) return std::nullopt;
  if (rec.ppid < 0) rec.ppid = 0;
  return rec;
}

uint64_t SampleReader::parse_vmrss_kb(std::string_view status) {
  size_t start = 0;
  while (start < status.size()) {
    size_t end = status.find('\n', start);
    if (end == std::string_view::npos) end = status.size();
    std::string_view line = status.substr(start, end - start);
    if (line.starts_with("VmRSS:")) {
      auto parts = split_ws(line.substr(6));
      uint64_t kb = 0;
      if (parts.size() >= 2 && parts[1] == "kB" && parse_num(parts[0], kb)) return kb;
      return 0;
    }
    start = end + 1;
  }
  return 0;
}

std::string SampleReader::format_command_line(const std::vector<unsigned char>& raw, const std::string& name) {
  std::string joined;
  joined.reserve(raw.size());
  for (auto b : raw) joined.push_back(b == 0 ? ' ' : static_cast<char>(b));
  auto cmd = procstat::util::sanitize_printable(joined);
  if (cmd.empty()) cmd = "[" + procstat::util::sanitize_printable(name) + "]";
  return procstat::util::truncate_display(std::move(cmd));
}

std::string SampleReader::pid_path(int32_t pid, const char* leaf) const {
  std::string p = validator_.root() + "/" + std::to_string(pid);
  if (leaf && *leaf) { p += '/'; p += leaf; }
  return p;
}

std::optional<std::string> SampleReader::read_gated(const std::string& path) const {
  if (!validator_.is_allowed(path)) return std::nullopt;
  return procstat::util::read_file_string(path);
}

std::optional<StatRecord> SampleReader::read_process_record(int32_t pid) const {
  if (pid <= 0 || pid > kMaxPid) return std::nullopt;
  auto txt = read_gated(pid_path(pid, "stat"));
  if (!txt) return std::nullopt;
  return parse_stat_record(*txt, parse_zombies_);
}

std::optional<StatRecord> SampleReader::read_thread_record(int32_t pid, int32_t tid) const {
  if (pid <= 0 || pid > kMaxPid || tid <= 0 || tid > kMaxPid) return std::nullopt;
  auto txt = read_gated(pid_path(pid, "task") + "/" + std::to_string(tid) + "/stat");
  if (!txt) return std::nullopt;
  return parse_stat_record(*txt, parse_zombies_);
}

uint64_t SampleReader::read_rss_kb(int32_t pid) const {
  if (pid <= 0 || pid > kMaxPid) return 0;
  auto txt = read_gated(pid_path(pid, "status"));
  if (!txt) return 0;
  return parse_vmrss_kb(*txt);
}

double SampleReader::read_memory_mb(int32_t pid) const {
  return static_cast<double>(read_rss_kb(pid)) / 1024.0;
}

std::string SampleReader::read_command_line(int32_t pid, const std::string& name) const {
  std::optional<std::vector<unsigned char>> bytes;
  if (pid > 0 && pid <= kMaxPid) {
    auto path = pid_path(pid, "cmdline");
    if (validator_.is_allowed(path)) bytes = procstat::util::read_file_bytes(path);
  }
  return format_command_line(bytes ? *bytes : std::vector<unsigned char>{}, name);
}

std::vector<int32_t> SampleReader::list_threads(int32_t pid) const {
  std::vector<int32_t> out;
  if (pid <= 0 || pid > kMaxPid) return out;
  auto dir = pid_path(pid, "task");
  if (!validator_.is_allowed(dir)) return out;
  for (const auto& name : procstat::util::list_dir(dir)) {
    if (auto tid = PathValidator::parse_identity(name)) out.push_back(*tid);
  }
  return out;
}

} // namespace procstat::collectors

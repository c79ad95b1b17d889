#include "collectors/PathValidator.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace procstat::collectors {

static std::string canonical_or_empty(const std::string& p) {
  std::error_code ec;
  auto c = fs::canonical(fs::path(p), ec);
  if (ec) return {};
  return c.string();
}

static bool is_directory(const std::string& p) {
  std::error_code ec;
  return fs::is_directory(fs::path(p), ec);
}

PathValidator::PathValidator() : PathValidator(procstat::util::proc_root()) {}

PathValidator::PathValidator(std::string root)
  : root_(std::move(root)), canonical_root_(canonical_or_empty(root_)) {}

std::optional<int32_t> PathValidator::parse_identity(const std::string& segment) {
  if (segment.size() > 7 || !procstat::util::is_all_digits(segment)) return std::nullopt;
  int32_t v = 0;
  auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), v);
  if (ec != std::errc{} || ptr != segment.data() + segment.size()) return std::nullopt;
  if (v <= 0 || v > kMaxPid) return std::nullopt;
  return v;
}

bool PathValidator::is_allowed(const std::string& path) const {
  if (canonical_root_.empty() || path.empty()) return false;
  const std::string resolved = canonical_or_empty(path);
  if (resolved.empty()) return false; // missing, or a dangling/looping link

  // Must sit strictly below the root
  const std::string prefix = (canonical_root_ == "/") ? canonical_root_ : canonical_root_ + "/";
  if (resolved.size() <= prefix.size()) return false;
  if (resolved.compare(0, prefix.size(), prefix) != 0) return false;

  std::vector<std::string> parts;
  size_t start = prefix.size();
  while (start <= resolved.size()) {
    size_t end = resolved.find('/', start);
    if (end == std::string::npos) end = resolved.size();
    parts.emplace_back(resolved.substr(start, end - start));
    start = end + 1;
  }
  if (parts.empty() || parts.size() > 4) return false;
  for (const auto& seg : parts) {
    if (seg.empty() || seg == "." || seg == "..") return false;
  }
  if (!parse_identity(parts[0])) return false;

  switch (parts.size()) {
    case 1:
      return is_directory(resolved);
    case 2:
      if (parts[1] == "task") return is_directory(resolved);
      return parts[1] == "stat" || parts[1] == "status" || parts[1] == "cmdline";
    case 3:
      return false;
    case 4:
      return parts[1] == "task" && parse_identity(parts[2]).has_value() && parts[3] == "stat";
  }
  return false;
}

} // namespace procstat::collectors

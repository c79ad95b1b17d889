#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace procstat::collectors {

// Kernel PID_MAX_LIMIT on 64-bit; no pid or tid can exceed it
inline constexpr int32_t kMaxPid = 4194304;

// Gate for every pseudo-file we open. A path is allowed only when its
// canonical form is one of:
//   <root>/<pid>              (directory)
//   <root>/<pid>/stat|status|cmdline
//   <root>/<pid>/task         (directory)
//   <root>/<pid>/task/<tid>/stat
// Any process can name itself or its children arbitrarily, and /proc links
// such as cwd or exe point anywhere, so symlinks are resolved first.
class PathValidator {
public:
  // root defaults to util::proc_root()
  PathValidator();
  explicit PathValidator(std::string root);

  [[nodiscard]] bool is_allowed(const std::string& path) const;

  // Physical root as given (not canonicalized)
  [[nodiscard]] const std::string& root() const { return root_; }
  [[nodiscard]] bool root_available() const { return !canonical_root_.empty(); }

  // Parse a pid/tid path segment: digits only, 1..kMaxPid
  [[nodiscard]] static std::optional<int32_t> parse_identity(const std::string& segment);

private:
  std::string root_;
  std::string canonical_root_;
};

} // namespace procstat::collectors

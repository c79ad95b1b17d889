#include "util/Procfs.hpp"

#include <sys/types.h>
#include <dirent.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace procstat::util {

static std::string remap_root() {
  const char* env = std::getenv("PROCSTAT_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

auto proc_root() -> std::string {
  return map_proc_path("/proc");
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  auto root = remap_root();
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

// Pseudo-files report st_size 0, so read in chunks until EOF or the cap.
template <typename Buffer>
static bool read_capped(const std::string& path, size_t max_bytes, Buffer& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  char chunk[4096];
  while (out.size() < max_bytes) {
    size_t want = std::min(sizeof(chunk), max_bytes - out.size());
    in.read(chunk, static_cast<std::streamsize>(want));
    auto got = in.gcount();
    if (got > 0) out.insert(out.end(), chunk, chunk + got);
    if (!in) break;
  }
  // A process that exits mid-read leaves the stream in a bad (not eof) state
  return !in.bad();
}

auto read_file_string(const std::string& path, size_t max_bytes) -> std::optional<std::string> {
  std::string s;
  if (!read_capped(path, max_bytes, s)) return std::nullopt;
  return s;
}

auto read_file_bytes(const std::string& path, size_t max_bytes) -> std::optional<std::vector<unsigned char>> {
  std::vector<unsigned char> buf;
  if (!read_capped(path, max_bytes, buf)) return std::nullopt;
  return buf;
}

auto list_dir(const std::string& path) -> std::vector<std::string> {
  std::vector<std::string> out;
  DIR* d = ::opendir(path.c_str());
  if (!d) return out;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  return out;
}

bool is_all_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

} // namespace procstat::util

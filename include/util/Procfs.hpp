// Helpers for reading /proc with an optional root remap (PROCSTAT_PROC_ROOT)
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace procstat::util {

// Upper bound on bytes read from any single pseudo-file
inline constexpr size_t kMaxReadBytes = 64 * 1024;

// Physical location of the /proc tree. "/proc" unless PROCSTAT_PROC_ROOT is
// set, in which case "<root>/proc".
auto proc_root() -> std::string;

// Map an absolute /proc path to the physical tree
auto map_proc_path(const std::string& abs) -> std::string;

// Read at most max_bytes of a file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& path, size_t max_bytes = kMaxReadBytes) -> std::optional<std::string>;

// Read at most max_bytes of a file as bytes. Returns std::nullopt on error.
auto read_file_bytes(const std::string& path, size_t max_bytes = kMaxReadBytes)
    -> std::optional<std::vector<unsigned char>>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& path) -> std::vector<std::string>;

[[nodiscard]] bool is_all_digits(const std::string& s);

} // namespace procstat::util

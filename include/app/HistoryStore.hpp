#pragma once
#include "model/Process.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>

namespace procstat::app {

// pid for processes; pid+tid for threads (tid 0 = the process itself)
struct Identity {
  int32_t pid{};
  int32_t tid{};
  bool operator==(const Identity&) const = default;

  [[nodiscard]] static Identity process(int32_t pid) { return Identity{pid, 0}; }
  [[nodiscard]] static Identity thread(int32_t pid, int32_t tid) { return Identity{pid, tid}; }
};

struct IdentityHash {
  size_t operator()(const Identity& id) const noexcept {
    uint64_t k = (static_cast<uint64_t>(static_cast<uint32_t>(id.pid)) << 32) | static_cast<uint32_t>(id.tid);
    return std::hash<uint64_t>{}(k);
  }
};

struct HistoryEntry {
  uint64_t total_ticks{};
  double   timestamp{};
};

inline constexpr double kRowCacheTtlSeconds = 1.0;

// Last-seen tick counters per identity, for delta-mode CPU%, plus a
// short-lived cache of derived rows. Both maps are bounded by capacity();
// put() evicts the least recently updated entries to stay within it.
class HistoryStore {
public:
  explicit HistoryStore(size_t capacity, double row_ttl_seconds = kRowCacheTtlSeconds);

  [[nodiscard]] std::optional<HistoryEntry> get(const Identity& id) const;
  void put(const Identity& id, uint64_t total_ticks, double timestamp);

  // Drop entries with now - timestamp > max_age_seconds, and rows past the TTL
  void evict_stale(double now, double max_age_seconds);

  // Keep only the max_entries most recently updated history entries
  void evict_over_capacity(size_t max_entries);

  [[nodiscard]] std::optional<model::ProcessSample> cached_row(const Identity& id, double now) const;
  void cache_row(const Identity& id, const model::ProcessSample& row, double now);

  [[nodiscard]] size_t size() const { return entries_.size(); }
  [[nodiscard]] size_t cached_rows() const { return rows_.size(); }
  [[nodiscard]] size_t capacity() const { return capacity_; }
  void clear();

private:
  struct Slot {
    HistoryEntry entry;
    uint64_t touch{};
  };
  struct CachedRow {
    model::ProcessSample row;
    double   cached_at{};
    uint64_t touch{};
  };

  template <typename Map>
  static void trim_oldest(Map& map, size_t max_entries);

  size_t capacity_;
  double row_ttl_;
  uint64_t touch_seq_{0};
  std::unordered_map<Identity, Slot, IdentityHash> entries_;
  std::unordered_map<Identity, CachedRow, IdentityHash> rows_;
};

} // namespace procstat::app

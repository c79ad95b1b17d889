#include "app/HistoryStore.hpp"

#include <algorithm>
#include <vector>

namespace procstat::app {

HistoryStore::HistoryStore(size_t capacity, double row_ttl_seconds)
  : capacity_(std::max<size_t>(1, capacity)), row_ttl_(row_ttl_seconds) {}

template <typename Map>
void HistoryStore::trim_oldest(Map& map, size_t max_entries) {
  if (map.size() <= max_entries) return;
  if (max_entries == 0) { map.clear(); return; }
  std::vector<uint64_t> touches;
  touches.reserve(map.size());
  for (const auto& kv : map) touches.push_back(kv.second.touch);
  // touch sequence numbers are unique: everything below the cutoff goes
  size_t drop = map.size() - max_entries;
  std::nth_element(touches.begin(), touches.begin() + static_cast<std::ptrdiff_t>(drop), touches.end());
  uint64_t cutoff = touches[drop];
  for (auto it = map.begin(); it != map.end(); ) {
    if (it->second.touch < cutoff) it = map.erase(it); else ++it;
  }
}

std::optional<HistoryEntry> HistoryStore::get(const Identity& id) const {
  auto it = entries_.find(id);
  if (it == entries_.end()) return std::nullopt;
  return it->second.entry;
}

void HistoryStore::put(const Identity& id, uint64_t total_ticks, double timestamp) {
  auto& slot = entries_[id];
  slot.entry = HistoryEntry{total_ticks, timestamp};
  slot.touch = ++touch_seq_;
  if (entries_.size() > capacity_) {
    // Trim in batches so a full store does not pay a pass per insert
    size_t low_water = std::max<size_t>(1, capacity_ - capacity_ / 8);
    trim_oldest(entries_, low_water);
  }
}

void HistoryStore::evict_stale(double now, double max_age_seconds) {
  for (auto it = entries_.begin(); it != entries_.end(); ) {
    if (now - it->second.entry.timestamp > max_age_seconds) it = entries_.erase(it); else ++it;
  }
  for (auto it = rows_.begin(); it != rows_.end(); ) {
    if (now - it->second.cached_at >= row_ttl_) it = rows_.erase(it); else ++it;
  }
}

void HistoryStore::evict_over_capacity(size_t max_entries) {
  trim_oldest(entries_, max_entries);
}

std::optional<model::ProcessSample> HistoryStore::cached_row(const Identity& id, double now) const {
  auto it = rows_.find(id);
  if (it == rows_.end()) return std::nullopt;
  if (now - it->second.cached_at >= row_ttl_) return std::nullopt;
  return it->second.row;
}

void HistoryStore::cache_row(const Identity& id, const model::ProcessSample& row, double now) {
  rows_[id] = CachedRow{row, now, ++touch_seq_};
  if (rows_.size() > capacity_) {
    size_t low_water = std::max<size_t>(1, capacity_ - capacity_ / 8);
    trim_oldest(rows_, low_water);
  }
}

void HistoryStore::clear() {
  entries_.clear();
  rows_.clear();
}

} // namespace procstat::app

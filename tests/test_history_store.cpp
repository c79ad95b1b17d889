#include "minitest.hpp"
#include "app/HistoryStore.hpp"

using procstat::app::HistoryStore;
using procstat::app::Identity;

TEST(history_get_put) {
  HistoryStore h(16);
  ASSERT_TRUE(!h.get(Identity::process(5)).has_value());
  h.put(Identity::process(5), 100, 1.0);
  h.put(Identity::thread(5, 6), 7, 1.0);
  h.put(Identity::process(5), 150, 2.0);
  auto e = h.get(Identity::process(5));
  ASSERT_TRUE(e.has_value());
  ASSERT_EQ(e->total_ticks, 150u);
  ASSERT_EQ(e->timestamp, 2.0);
  // a thread identity never collides with its process
  ASSERT_EQ(h.get(Identity::thread(5, 6))->total_ticks, 7u);
  ASSERT_EQ(h.size(), 2u);
}

TEST(history_never_exceeds_capacity) {
  HistoryStore h(100);
  for (int i = 1; i <= 5000; ++i) {
    h.put(Identity::process(i), static_cast<uint64_t>(i), static_cast<double>(i));
    ASSERT_TRUE(h.size() <= h.capacity());
    // the newest entry always survives
    ASSERT_TRUE(h.get(Identity::process(i)).has_value());
  }
  // the oldest ones went first
  ASSERT_TRUE(!h.get(Identity::process(1)).has_value());
}

TEST(history_updates_refresh_recency) {
  HistoryStore h(8);
  for (int i = 1; i <= 8; ++i) h.put(Identity::process(i), 0, 0.0);
  // keep pid 1 warm while others churn in
  for (int i = 9; i <= 40; ++i) {
    h.put(Identity::process(1), static_cast<uint64_t>(i), 0.0);
    h.put(Identity::process(i), 0, 0.0);
  }
  ASSERT_TRUE(h.get(Identity::process(1)).has_value());
  ASSERT_TRUE(h.size() <= 8u);
}

TEST(history_evicts_stale) {
  HistoryStore h(64);
  h.put(Identity::process(1), 10, 0.0);
  h.put(Identity::process(2), 10, 12.0);
  h.put(Identity::thread(2, 3), 10, 11.0);
  h.evict_stale(16.0, 5.0);
  ASSERT_TRUE(!h.get(Identity::process(1)).has_value());
  ASSERT_TRUE(h.get(Identity::process(2)).has_value());
  ASSERT_TRUE(h.get(Identity::thread(2, 3)).has_value());
  // exactly max_age old is kept
  h.evict_stale(17.0, 6.0);
  ASSERT_TRUE(h.get(Identity::thread(2, 3)).has_value());
  h.evict_stale(17.5, 6.0);
  ASSERT_TRUE(!h.get(Identity::thread(2, 3)).has_value());
}

TEST(history_evict_over_capacity_keeps_newest) {
  HistoryStore h(100);
  for (int i = 1; i <= 10; ++i) h.put(Identity::process(i), 0, static_cast<double>(i));
  h.evict_over_capacity(3);
  ASSERT_EQ(h.size(), 3u);
  ASSERT_TRUE(h.get(Identity::process(8)).has_value());
  ASSERT_TRUE(h.get(Identity::process(9)).has_value());
  ASSERT_TRUE(h.get(Identity::process(10)).has_value());
  h.evict_over_capacity(0);
  ASSERT_EQ(h.size(), 0u);
}

TEST(history_row_cache_ttl) {
  HistoryStore h(16);
  procstat::model::ProcessSample row;
  row.pid = 9;
  row.cpu_pct = 12.5;
  h.cache_row(Identity::process(9), row, 10.0);
  auto hit = h.cached_row(Identity::process(9), 10.5);
  ASSERT_TRUE(hit.has_value());
  ASSERT_EQ(hit->cpu_pct, 12.5);
  ASSERT_TRUE(!h.cached_row(Identity::process(9), 11.0).has_value());
  ASSERT_TRUE(!h.cached_row(Identity::thread(9, 10), 10.5).has_value());
  h.evict_stale(11.0, 5.0);
  ASSERT_EQ(h.cached_rows(), 0u);
}

TEST(history_row_cache_bounded) {
  HistoryStore h(32);
  procstat::model::ProcessSample row;
  for (int i = 1; i <= 1000; ++i) {
    row.pid = i;
    h.cache_row(Identity::process(i), row, 0.0);
    ASSERT_TRUE(h.cached_rows() <= 32u);
  }
  h.clear();
  ASSERT_EQ(h.size(), 0u);
  ASSERT_EQ(h.cached_rows(), 0u);
}

#include "app/Ranker.hpp"

#include <algorithm>

namespace procstat::app {

using procstat::model::ProcessSample;
using procstat::model::SortField;

bool ranks_before(const ProcessSample& a, const ProcessSample& b, SortField field) {
  switch (field) {
    case SortField::CPU:
      if (a.cpu_pct != b.cpu_pct) return a.cpu_pct > b.cpu_pct;
      break;
    case SortField::MEM:
      if (a.rss_kb != b.rss_kb) return a.rss_kb > b.rss_kb;
      break;
    case SortField::PID:
      if (a.pid != b.pid) return a.pid > b.pid;
      break;
    case SortField::COMMAND:
      if (a.command_line != b.command_line) return a.command_line > b.command_line;
      break;
    case SortField::TIME:
      if (a.cpu_time_s != b.cpu_time_s) return a.cpu_time_s > b.cpu_time_s;
      break;
  }
  if (a.pid != b.pid) return a.pid < b.pid;
  return a.kind == model::RowKind::Process && b.kind == model::RowKind::Thread;
}

void sort_rows(std::vector<ProcessSample>& rows, SortField field) {
  std::sort(rows.begin(), rows.end(), [field](const ProcessSample& a, const ProcessSample& b){
    return ranks_before(a, b, field);
  });
}

std::vector<ProcessSample> top_n(const std::vector<ProcessSample>& rows, SortField field, size_t n) {
  std::vector<ProcessSample> out;
  if (n == 0 || rows.empty()) return out;
  if (n >= rows.size()) {
    out = rows;
    sort_rows(out, field);
    return out;
  }

  // Max-heap on rank: front() is the worst row currently kept
  auto worse = [&](size_t a, size_t b){ return ranks_before(rows[a], rows[b], field); };
  std::vector<size_t> heap;
  heap.reserve(n);
  for (size_t i = 0; i < rows.size(); ++i) {
    if (heap.size() < n) {
      heap.push_back(i);
      std::push_heap(heap.begin(), heap.end(), worse);
    } else if (ranks_before(rows[i], rows[heap.front()], field)) {
      std::pop_heap(heap.begin(), heap.end(), worse);
      heap.back() = i;
      std::push_heap(heap.begin(), heap.end(), worse);
    }
  }
  std::sort_heap(heap.begin(), heap.end(), worse);
  out.reserve(heap.size());
  for (size_t idx : heap) out.push_back(rows[idx]);
  return out;
}

} // namespace procstat::app

#pragma once
#include "model/Process.hpp"

#include <cstddef>
#include <vector>

namespace procstat::app {

// Strict total order: field descending, then pid ascending, then processes
// before threads.
[[nodiscard]] bool ranks_before(const model::ProcessSample& a, const model::ProcessSample& b,
                                model::SortField field);

// First n rows of the full ordering. Uses a bounded heap of n rows when n is
// smaller than the input; the result is identical to sorting everything and
// truncating.
[[nodiscard]] std::vector<model::ProcessSample> top_n(const std::vector<model::ProcessSample>& rows,
                                                      model::SortField field, size_t n);

// Full sort, kept for callers that want every row ordered
void sort_rows(std::vector<model::ProcessSample>& rows, model::SortField field);

} // namespace procstat::app

#pragma once

#include "app/Options.hpp"
#include "model/Process.hpp"
#include <string>
#include <vector>

namespace procstat::ui {

inline constexpr int kTableWidth = 80;

// Fixed-width table of ranked rows. With show_summary a totals line follows.
// Empty rows render the "no processes" notice (plus a sudo hint unless root).
std::string render_process_table(const std::vector<procstat::model::ProcessSample>& rows,
                                 procstat::app::MemoryUnit unit,
                                 bool show_summary,
                                 bool is_root = true);

// Three header lines and a blank line printed above each watch frame
std::string render_watch_header(int iteration, const std::string& local_time, double uptime_s,
                                const procstat::app::Options& opts);

// "Total entries displayed: N" footer for one-shot table output
std::string render_total_entries(size_t total);

} // namespace procstat::ui

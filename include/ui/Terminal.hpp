#pragma once

#include <atomic>
#include <cstddef>
#include <string_view>

namespace procstat::ui {

// Set by the signal handlers; polled by the watch loop
extern std::atomic<bool> g_stop;

void on_signal(int);

// SIGINT, SIGTERM and SIGHUP request a clean stop. Returns false if any
// handler could not be installed.
bool install_signal_handlers();

[[nodiscard]] bool tty_stdout();

// Erase the screen and home the cursor
void clear_screen();

// Best-effort write (async-signal-safe)
void best_effort_write(int fd, const char* buf, size_t len);
void best_effort_write(int fd, std::string_view sv);

} // namespace procstat::ui

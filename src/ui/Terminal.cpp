#include "ui/Terminal.hpp"
#include <csignal>
#include <cstdio>
#include <unistd.h>

namespace procstat::ui {

std::atomic<bool> g_stop{false};

void best_effort_write(int fd, const char* buf, size_t len) {
  while (len > 0) {
    ssize_t n = ::write(fd, buf, len);
    if (n <= 0) return;
    buf += n;
    len -= static_cast<size_t>(n);
  }
}

void best_effort_write(int fd, std::string_view sv) { best_effort_write(fd, sv.data(), sv.size()); }

void on_signal(int) { g_stop.store(true); }

bool install_signal_handlers() {
  struct sigaction sa{};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  // No SA_RESTART: the watch sleep should wake early
  sa.sa_flags = 0;
  bool ok = true;
  for (int sig : {SIGINT, SIGTERM, SIGHUP}) {
    if (::sigaction(sig, &sa, nullptr) != 0) ok = false;
  }
  return ok;
}

bool tty_stdout() {
  return ::isatty(STDOUT_FILENO) == 1;
}

void clear_screen() {
  std::fflush(stdout);
  best_effort_write(STDOUT_FILENO, "\033[2J\033[;H");
}

} // namespace procstat::ui

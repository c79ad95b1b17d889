#include "app/Monitor.hpp"
#include "app/Options.hpp"
#include "app/ProcessScanner.hpp"
#include "collectors/SystemClock.hpp"
#include "ui/Terminal.hpp"
#include "util/Error.hpp"
#include "util/Procfs.hpp"

#include <cstdio>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>

int main(int argc, char** argv) {
  std::vector<std::string> warnings;
  auto opts = procstat::app::load_options(argc, argv, warnings);
  for (const auto& w : warnings) std::fprintf(stderr, "procstat: warning: %s\n", w.c_str());
  if (opts.show_help) {
    std::fputs(procstat::app::usage_text(argc > 0 ? argv[0] : nullptr).c_str(), stdout);
    return 0;
  }

  try {
    procstat::collectors::validate_proc_root();
    procstat::collectors::SystemClock clock;
    if (opts.verbose)
      std::fprintf(stderr, "procstat: debug: config %s\n", opts.config_path.empty() ? "(none)" : opts.config_path.c_str());

    auto scanner = std::make_unique<procstat::app::ProcessScanner>(procstat::app::to_scan_options(opts), clock);
    if (!scanner->init()) {
      std::fprintf(stderr, "procstat: error: cannot access %s, check permissions\n", procstat::util::proc_root().c_str());
      return 1;
    }
    if (!procstat::ui::install_signal_handlers())
      std::fprintf(stderr, "procstat: warning: could not install signal handlers\n");

    procstat::app::Monitor monitor(opts, std::move(scanner));
    return monitor.run(procstat::ui::g_stop);
  } catch (const procstat::util::FatalError& e) {
    std::fprintf(stderr, "procstat: error: %s\n", e.what());
    if (::geteuid() != 0) std::fprintf(stderr, "procstat: note: some systems require root to read all process information\n");
    return 1;
  }
}

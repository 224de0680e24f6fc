#include "ui/App.hpp"
#include "ui/Input.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include "util/Churn.hpp"

#include <csignal>
#include <cstdlib>
#include <unistd.h>

namespace pui::ui {

static constexpr int kPollMs = 250;
static constexpr int kChurnWindowMs = 60000;

int run_interactive(pui::app::Session& session, const Config& cfg, std::string& fatal) {
  pui::collectors::ScanError err;
  if (!session.start(err)) {
    fatal = "initial scan failed: " + err.message;
    return 1;
  }

  std::signal(SIGINT, on_sigint);
  std::signal(SIGTERM, on_sigint);

  RawTermGuard raw{};
  if (!raw.active()) {
    fatal = "cannot switch the terminal to raw mode";
    return 1;
  }
  CursorGuard curs{};
  AltScreenGuard alt{cfg.ui.alt_screen && tty_stdout()};
  std::atexit(&on_atexit_restore);
  best_effort_write(STDOUT_FILENO, "\x1B[2J\x1B[H", 7);

  RenderOptions ro;
  ro.show_address = cfg.ui.show_address;
  for (;;) {
    ro.churn = pui::util::count_recent_ms(kChurnWindowMs);
    render_screen(build_frame(session, ro, term_cols(), term_rows()), cfg.colors);
    if (g_stop.load()) session.request_quit();
    if (session.should_exit()) break;
    if (!has_input_available(kPollMs)) continue;
    session.dispatch_batch(read_actions());
  }
  return 0;
}

} // namespace pui::ui

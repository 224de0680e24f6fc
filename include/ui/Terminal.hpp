#pragma once

#include <string>
#include <atomic>
#include <termios.h>

namespace pui::ui {

// Terminal state management
extern std::atomic<bool> g_stop;
extern std::atomic<bool> g_alt_in_use;

void restore_terminal_minimal();
void on_sigint(int);
void on_atexit_restore();

// Terminal capability detection
[[nodiscard]] bool tty_stdout();
[[nodiscard]] bool tty_stdin();
[[nodiscard]] bool use_unicode();
[[nodiscard]] int term_cols();
[[nodiscard]] int term_rows();

// SGR code generation (empty strings when stdout is not a TTY)
[[nodiscard]] std::string sgr(const char* code);
[[nodiscard]] std::string sgr_reset();
[[nodiscard]] std::string sgr_bold();
[[nodiscard]] std::string sgr_reverse();
[[nodiscard]] std::string sgr_palette_idx(int idx);
[[nodiscard]] std::string sgr_truecolor(int r, int g, int b);

// Best-effort terminal write (async-signal-safe)
void best_effort_write(int fd, const char* buf, size_t len);

// RAII guards for terminal state
class RawTermGuard {
  bool active_{false};
  termios old_{};
  int old_flags_{0};
public:
  RawTermGuard();
  ~RawTermGuard();
  RawTermGuard(const RawTermGuard&) = delete;
  RawTermGuard& operator=(const RawTermGuard&) = delete;
  [[nodiscard]] bool active() const { return active_; }
};

class CursorGuard {
  bool active_{false};
public:
  CursorGuard();
  ~CursorGuard();
  CursorGuard(const CursorGuard&) = delete;
  CursorGuard& operator=(const CursorGuard&) = delete;
};

class AltScreenGuard {
  bool active_{false};
public:
  explicit AltScreenGuard(bool enable);
  ~AltScreenGuard();
  AltScreenGuard(const AltScreenGuard&) = delete;
  AltScreenGuard& operator=(const AltScreenGuard&) = delete;
};

} // namespace pui::ui

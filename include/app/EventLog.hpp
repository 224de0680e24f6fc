#pragma once

#include <filesystem>
#include <fstream>

namespace pui::app {

// Append-only diagnostic log. The full-screen UI owns the terminal, so scan
// and kill events go to a file instead of stderr. Disabled until open().
class EventLog {
public:
  EventLog() = default;
  EventLog(const EventLog&) = delete;
  EventLog& operator=(const EventLog&) = delete;

  // Open (append) the log file, creating parent directories. Reports a
  // failure once on stderr and leaves the log disabled.
  bool open(const std::filesystem::path& file);

  [[nodiscard]] bool enabled() const { return file_.is_open(); }
  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

  // printf-style; each call writes one "YYYY-MM-DD HH:MM:SS message" line
  void logf(const char* fmt, ...) __attribute__((format(printf, 2, 3)));

private:
  std::filesystem::path path_;
  std::ofstream file_;
};

} // namespace pui::app

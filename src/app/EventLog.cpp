#include "app/EventLog.hpp"
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <string>

namespace pui::app {

bool EventLog::open(const std::filesystem::path& file) {
  path_ = file;
  std::error_code ec;
  if (file.has_parent_path()) {
    std::filesystem::create_directories(file.parent_path(), ec);
    if (ec) {
      std::fprintf(stderr, "pui: EventLog: failed to create %s: %s\n",
                   file.parent_path().c_str(), ec.message().c_str());
      return false;
    }
  }
  file_.open(file, std::ios::app);
  if (!file_) {
    std::fprintf(stderr, "pui: EventLog: failed to open %s: %s\n",
                 file.c_str(), std::strerror(errno));
    return false;
  }
  return true;
}

void EventLog::logf(const char* fmt, ...) {
  if (!file_.is_open()) return;
  char small[512];
  va_list ap;
  va_start(ap, fmt);
  va_list retry;
  va_copy(retry, ap);
  int n = std::vsnprintf(small, sizeof(small), fmt, ap);
  va_end(ap);
  std::string msg;
  if (n < 0) {
    msg = fmt; // bad format: keep the raw text
  } else if (static_cast<size_t>(n) < sizeof(small)) {
    msg.assign(small, static_cast<size_t>(n));
  } else {
    msg.resize(static_cast<size_t>(n) + 1);
    std::vsnprintf(msg.data(), msg.size(), fmt, retry);
    msg.resize(static_cast<size_t>(n));
  }
  va_end(retry);

  auto now_t = std::time(nullptr);
  std::tm tm{};
  ::localtime_r(&now_t, &tm);
  char ts[32];
  std::snprintf(ts, sizeof(ts), "%04d-%02d-%02d %02d:%02d:%02d",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec);

  file_ << ts << ' ' << msg << '\n';
  file_.flush();
}

} // namespace pui::app

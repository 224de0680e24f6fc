#include "app/ProcessKiller.hpp"

#include <sys/types.h>
#include <signal.h>

#include <cerrno>
#include <cstring>

namespace pui::app {

KillError kill_error_from_errno(int err) {
  KillError e;
  switch (err) {
    case EPERM: e.reason = KillFailure::PermissionDenied; break;
    case ESRCH: e.reason = KillFailure::NoSuchProcess; break;
    default:    e.reason = KillFailure::Other; break;
  }
  e.message = std::strerror(err);
  return e;
}

bool SignalKiller::terminate(int32_t pid, KillError& err) {
  // 0 and negative pids address process groups; never ours to signal
  if (pid <= 0) {
    err = kill_error_from_errno(ESRCH);
    return false;
  }
  if (::kill(static_cast<pid_t>(pid), SIGTERM) == 0) return true;
  err = kill_error_from_errno(errno);
  return false;
}

} // namespace pui::app

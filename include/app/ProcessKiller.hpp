#pragma once
#include <cstdint>
#include <string>

namespace pui::app {

enum class KillFailure { PermissionDenied, NoSuchProcess, Other };

struct KillError {
  KillFailure reason{KillFailure::Other};
  std::string message;
};

class IProcessKiller {
public:
  virtual ~IProcessKiller() = default;
  // Ask the process to terminate. Fire-and-forget: success means the signal
  // was delivered, not that the process has exited.
  [[nodiscard]] virtual bool terminate(int32_t pid, KillError& err) = 0;
};

// Sends SIGTERM via kill(2).
class SignalKiller : public IProcessKiller {
public:
  bool terminate(int32_t pid, KillError& err) override;
};

// Map a kill(2) errno to a KillError.
KillError kill_error_from_errno(int err);

} // namespace pui::app

#pragma once
#include "model/Listener.hpp"
#include <string>

namespace pui::collectors {

// Why a scan produced no usable snapshot (facility missing, output malformed).
struct ScanError {
  std::string message;
};

// Capability interface over the platform's socket enumeration facility so
// the session can run against /proc parsing, the ss(8) tool, or a test stub.
class IPortScanner {
public:
  virtual ~IPortScanner() = default;

  // Probe the facility. Return false if unavailable on this system.
  // Default: available (no-op)
  [[nodiscard]] virtual bool init() { return true; }

  // Produce a full replacement snapshot. On false, err is filled and out is
  // left untouched. Sockets owned by invisible processes are not an error;
  // they are counted in out.hidden.
  [[nodiscard]] virtual bool scan(pui::model::PortSnapshot& out, ScanError& err) = 0;

  // Short label for the title bar and the event log
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace pui::collectors

#pragma once
#include "collectors/IPortScanner.hpp"
#include <memory>
#include <string>

namespace pui::app {

struct ScannerChoice {
  std::unique_ptr<pui::collectors::IPortScanner> scanner; // null: nothing usable
  std::string note; // fallback taken, or why nothing was usable
};

// Pick the socket enumeration facility at startup.
// mode: "procfs" | "ss" | "auto" (procfs, falling back to ss)
ScannerChoice select_port_scanner(const std::string& mode, bool include_udp,
                                  const std::string& ss_path);

} // namespace pui::app

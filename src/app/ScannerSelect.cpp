#include "app/ScannerSelect.hpp"
#include "collectors/ProcNetScanner.hpp"
#include "collectors/SsPortScanner.hpp"

namespace pui::app {

using pui::collectors::IPortScanner;

ScannerChoice select_port_scanner(const std::string& mode, bool include_udp,
                                  const std::string& ss_path) {
  ScannerChoice choice;
  auto make_procfs = [&]() {
    return std::unique_ptr<IPortScanner>(new pui::collectors::ProcNetScanner(include_udp));
  };
  auto make_ss = [&]() {
    return std::unique_ptr<IPortScanner>(new pui::collectors::SsPortScanner(ss_path, include_udp));
  };

  if (mode == "procfs") {
    auto s = make_procfs();
    if (s->init()) choice.scanner = std::move(s);
    else choice.note = "procfs scanner unavailable: cannot read /proc/net/tcp";
  } else if (mode == "ss") {
    auto s = make_ss();
    if (s->init()) choice.scanner = std::move(s);
    else choice.note = ss_path.empty() ? "ss scanner unavailable: ss not found in PATH"
                                       : "ss scanner unavailable: " + ss_path + " not found";
  } else if (mode == "auto") {
    auto procfs = make_procfs();
    if (procfs->init()) {
      choice.scanner = std::move(procfs);
    } else {
      auto ss = make_ss();
      if (ss->init()) {
        choice.scanner = std::move(ss);
        choice.note = "/proc/net unreadable. Falling back to ss.";
      } else {
        choice.note = "no socket enumeration facility: /proc/net unreadable and ss not found";
      }
    }
  } else {
    choice.note = "unknown scanner '" + mode + "' (expected auto, procfs or ss)";
  }
  return choice;
}

} // namespace pui::app

#pragma once
#include "collectors/IPortScanner.hpp"
#include "collectors/ProcessResolver.hpp"
#include <string>
#include <vector>

namespace pui::collectors {

// Runs iproute2's ss(8) and parses its listening-socket report. Used when
// /proc/net is not readable (hardened containers, hidepid mounts).
class SsPortScanner : public IPortScanner {
public:
  // ss_path empty: search PATH, then the usual sbin locations
  explicit SsPortScanner(std::string ss_path = {}, bool include_udp = true);
  bool init() override;
  bool scan(pui::model::PortSnapshot& out, ScanError& err) override;
  const char* name() const override { return "ss"; }

  // Parse `ss -H -l -n -p` output into out. With both -t and -u rows carry
  // a Netid column; with a single socket type ss drops it and the protocol
  // follows from the state (LISTEN: tcp, UNCONN: udp). Rows without a
  // users:() column (owner not visible) are counted in out.hidden. UDP rows
  // are dropped when include_udp is false. Returns false if any non-empty
  // line is not an ss socket row.
  static bool parse_output(const std::string& text, pui::model::PortSnapshot& out,
                           bool include_udp = true);

  // Single-quote s for /bin/sh
  static std::string shell_quote(const std::string& s);

private:
  std::string find_ss() const;

  std::string configured_path_;
  std::string path_;
  bool include_udp_{true};
  ProcessResolver resolver_;
};

} // namespace pui::collectors

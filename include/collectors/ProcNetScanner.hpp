#pragma once
#include "collectors/IPortScanner.hpp"
#include "collectors/ProcessResolver.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace pui::collectors {

// Reads the kernel socket tables in /proc/net and attributes each listening
// socket to a process through the socket inodes in /proc/<pid>/fd.
class ProcNetScanner : public IPortScanner {
public:
  // One qualifying (listening) row of a /proc/net table
  struct Row {
    uint64_t inode{};
    uint16_t port{};
    pui::model::Protocol protocol{pui::model::Protocol::TCP};
    std::string address;
  };

  explicit ProcNetScanner(bool include_udp = true);
  bool init() override;
  bool scan(pui::model::PortSnapshot& out, ScanError& err) override;
  const char* name() const override { return "procfs"; }

  // Parse the text of one table (tcp, tcp6, udp, udp6). Only listening rows
  // are appended: TCP in LISTEN, UDP bound and unconnected. Returns false
  // when the header line is missing (not a socket table).
  static bool parse_table(const std::string& text, pui::model::Protocol proto, bool ipv6,
                          std::vector<Row>& rows);

  // Decode the kernel's hex address ("0100007F" or 32 hex digits for v6).
  static bool decode_address(const std::string& hex, bool ipv6, std::string& out);

private:
  bool read_table(const char* path, pui::model::Protocol proto, bool ipv6, bool required,
                  std::vector<Row>& rows, ScanError& err) const;

  bool include_udp_{true};
  ProcessResolver resolver_;
};

} // namespace pui::collectors

#include "collectors/ProcNetScanner.hpp"
#include "collectors/Normalize.hpp"
#include "util/Procfs.hpp"
#include "util/Churn.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <unistd.h>

#include <cstring>
#include <sstream>
#include <unordered_map>

namespace pui::collectors {

using pui::model::Protocol;

// Kernel socket states as printed in the "st" column
static constexpr unsigned kTcpListen = 0x0A;
static constexpr unsigned kUdpUnconnected = 0x07; // TCP_CLOSE

ProcNetScanner::ProcNetScanner(bool include_udp) : include_udp_(include_udp) {}

bool ProcNetScanner::init() {
  return pui::util::read_file_string("/proc/net/tcp").has_value();
}

static bool parse_hex_u32(const std::string& s, uint32_t& out) {
  if (s.empty() || s.size() > 8) return false;
  try {
    size_t used = 0;
    unsigned long v = std::stoul(s, &used, 16);
    if (used != s.size()) return false;
    out = static_cast<uint32_t>(v);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool ProcNetScanner::decode_address(const std::string& hex, bool ipv6, std::string& out) {
  char buf[INET6_ADDRSTRLEN] = {0};
  if (!ipv6) {
    if (hex.size() != 8) return false;
    uint32_t word = 0;
    if (!parse_hex_u32(hex, word)) return false;
    // The kernel prints the network-order word as a host integer
    in_addr a{};
    std::memcpy(&a.s_addr, &word, sizeof(word));
    if (!::inet_ntop(AF_INET, &a, buf, sizeof(buf))) return false;
  } else {
    if (hex.size() != 32) return false;
    in6_addr a{};
    for (int i = 0; i < 4; ++i) {
      uint32_t word = 0;
      if (!parse_hex_u32(hex.substr(static_cast<size_t>(i) * 8, 8), word)) return false;
      std::memcpy(reinterpret_cast<unsigned char*>(&a) + i * 4, &word, sizeof(word));
    }
    if (!::inet_ntop(AF_INET6, &a, buf, sizeof(buf))) return false;
  }
  out = buf;
  return true;
}

static bool is_zero_hex(const std::string& s) {
  for (char c : s) if (c != '0') return false;
  return !s.empty();
}

bool ProcNetScanner::parse_table(const std::string& text, Protocol proto, bool ipv6,
                                 std::vector<Row>& rows) {
  std::istringstream ss(text);
  std::string line;
  if (!std::getline(ss, line) || line.find("local_address") == std::string::npos)
    return false;
  while (std::getline(ss, line)) {
    // format: sl local rem st tx:rx tr:when retrnsmt uid timeout inode ...
    std::istringstream ls(line);
    std::string sl, local, rem, st, txrx, trwhen, retr, uid, timeout, inode_s;
    if (!(ls >> sl >> local >> rem >> st >> txrx >> trwhen >> retr >> uid >> timeout >> inode_s))
      continue;
    uint32_t state = 0;
    if (!parse_hex_u32(st, state)) continue;
    auto lc = local.find(':');
    auto rc = rem.find(':');
    if (lc == std::string::npos || rc == std::string::npos) continue;
    uint32_t port = 0;
    if (!parse_hex_u32(local.substr(lc + 1), port) || port > 0xFFFF) continue;
    if (proto == Protocol::TCP) {
      if (state != kTcpListen) continue;
    } else {
      if (state != kUdpUnconnected || port == 0) continue;
      if (!is_zero_hex(rem.substr(0, rc)) || !is_zero_hex(rem.substr(rc + 1))) continue;
    }
    Row row;
    row.port = static_cast<uint16_t>(port);
    row.protocol = proto;
    if (!decode_address(local.substr(0, lc), ipv6, row.address)) continue;
    try { row.inode = std::stoull(inode_s); } catch (const std::exception&) { continue; }
    rows.push_back(std::move(row));
  }
  return true;
}

bool ProcNetScanner::read_table(const char* path, Protocol proto, bool ipv6, bool required,
                                std::vector<Row>& rows, ScanError& err) const {
  auto txt = pui::util::read_file_string(path);
  if (!txt) {
    if (!required) return true; // e.g. kernel built without IPv6
    err.message = std::string("cannot read ") + path;
    return false;
  }
  if (!parse_table(*txt, proto, ipv6, rows)) {
    err.message = std::string("malformed ") + path;
    return false;
  }
  return true;
}

bool ProcNetScanner::scan(pui::model::PortSnapshot& out, ScanError& err) {
  std::vector<Row> rows;
  if (!read_table("/proc/net/tcp", Protocol::TCP, false, true, rows, err)) return false;
  if (!read_table("/proc/net/tcp6", Protocol::TCP, true, false, rows, err)) return false;
  if (include_udp_) {
    if (!read_table("/proc/net/udp", Protocol::UDP, false, false, rows, err)) return false;
    if (!read_table("/proc/net/udp6", Protocol::UDP, true, false, rows, err)) return false;
  }

  auto owners = resolver_.inode_owners();
  std::unordered_map<int32_t, std::string> names; // one lookup per pid per scan

  // root sees every fd table, so an unowned socket closed while we walked /proc
  const bool privileged = ::geteuid() == 0;

  pui::model::PortSnapshot snap;
  snap.sockets_seen = rows.size();
  for (auto& r : rows) {
    auto it = owners.find(r.inode);
    if (r.inode == 0 || it == owners.end()) {
      if (privileged) pui::util::note_churn();
      else ++snap.hidden;
      continue;
    }
    int32_t pid = it->second;
    auto nit = names.find(pid);
    if (nit == names.end()) nit = names.emplace(pid, resolver_.resolve(pid)).first;
    pui::model::ListeningProcess lp;
    lp.pid = pid;
    lp.name = nit->second;
    lp.port = r.port;
    lp.protocol = r.protocol;
    lp.address = std::move(r.address);
    snap.entries.push_back(std::move(lp));
  }
  normalize_entries(snap.entries);
  out = std::move(snap);
  return true;
}

} // namespace pui::collectors

#include "collectors/SsPortScanner.hpp"
#include "collectors/Normalize.hpp"

#include <sys/wait.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <unordered_set>

namespace pui::collectors {

using pui::model::Protocol;

SsPortScanner::SsPortScanner(std::string ss_path, bool include_udp)
  : configured_path_(std::move(ss_path)), include_udp_(include_udp) {}

std::string SsPortScanner::find_ss() const {
  std::error_code ec;
  if (!configured_path_.empty()) {
    if (std::filesystem::exists(configured_path_, ec)) return configured_path_;
    return {};
  }
  if (const char* path = std::getenv("PATH")) {
    std::string p(path);
    size_t start = 0;
    while (start <= p.size()) {
      size_t end = p.find(':', start);
      std::string dir = p.substr(start, end == std::string::npos ? std::string::npos : end - start);
      if (!dir.empty()) {
        std::string cand = dir + "/ss";
        if (std::filesystem::exists(cand, ec)) return cand;
      }
      if (end == std::string::npos) break;
      start = end + 1;
    }
  }
  const char* candidates[] = {"/usr/sbin/ss", "/usr/bin/ss", "/sbin/ss", "/bin/ss"};
  for (const char* c : candidates) {
    if (std::filesystem::exists(c, ec)) return std::string(c);
  }
  return {};
}

bool SsPortScanner::init() {
  path_ = find_ss();
  return !path_.empty();
}

// Split "addr:port" at the last colon; strip [v6] brackets and %iface scope.
static bool split_local(const std::string& col, std::string& addr, uint16_t& port) {
  auto colon = col.rfind(':');
  if (colon == std::string::npos || colon + 1 >= col.size()) return false;
  std::string port_s = col.substr(colon + 1);
  if (port_s == "*") return false;
  try {
    size_t used = 0;
    unsigned long v = std::stoul(port_s, &used, 10);
    if (used != port_s.size() || v > 0xFFFF) return false;
    port = static_cast<uint16_t>(v);
  } catch (const std::exception&) {
    return false;
  }
  addr = col.substr(0, colon);
  if (addr.size() >= 2 && addr.front() == '[' && addr.back() == ']')
    addr = addr.substr(1, addr.size() - 2);
  auto pct = addr.find('%');
  if (pct != std::string::npos) addr.erase(pct);
  return true;
}

// users:(("nginx",pid=812,fd=6),("nginx",pid=813,fd=6))
static void parse_users(const std::string& col,
                        std::vector<std::pair<int32_t, std::string>>& owners) {
  auto pos = col.find("users:(");
  if (pos == std::string::npos) return;
  pos += 7;
  std::unordered_set<int32_t> seen;
  while (true) {
    auto open = col.find("(\"", pos);
    if (open == std::string::npos) break;
    auto name_end = col.find('"', open + 2);
    if (name_end == std::string::npos) break;
    std::string name = col.substr(open + 2, name_end - open - 2);
    auto close = col.find(')', name_end);
    auto pid_at = col.find("pid=", name_end);
    if (pid_at == std::string::npos || (close != std::string::npos && pid_at > close)) {
      pos = name_end + 1;
      continue;
    }
    int32_t pid = static_cast<int32_t>(std::strtol(col.c_str() + pid_at + 4, nullptr, 10));
    if (pid > 0 && seen.insert(pid).second) owners.emplace_back(pid, std::move(name));
    pos = (close == std::string::npos) ? pid_at + 4 : close + 1;
  }
}

std::string SsPortScanner::shell_quote(const std::string& s) {
  std::string q = "'";
  for (char c : s) {
    if (c == '\'') q += "'\\''";
    else q += c;
  }
  q += '\'';
  return q;
}

bool SsPortScanner::parse_output(const std::string& text, pui::model::PortSnapshot& out,
                                 bool include_udp) {
  std::istringstream ss(text);
  std::string line;
  while (std::getline(ss, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) continue;
    // [Netid] State Recv-Q Send-Q Local Peer [Process]
    std::istringstream ls(line);
    std::string first, state;
    if (!(ls >> first)) return false;
    bool ours = true;
    Protocol proto = Protocol::TCP;
    if (std::isupper(static_cast<unsigned char>(first[0]))) {
      // No Netid column: states are upper case, netids lower case
      state = first;
      if (state == "LISTEN") proto = Protocol::TCP;
      else if (state == "UNCONN") proto = Protocol::UDP;
      else ours = false;
    } else {
      if (!(ls >> state)) return false;
      if (first == "tcp") { proto = Protocol::TCP; ours = state == "LISTEN"; }
      else if (first == "udp") { proto = Protocol::UDP; ours = state == "UNCONN"; }
      else ours = false; // raw, sctp, unix ... are not ours
    }
    std::string recvq, sendq, local, peer;
    if (!(ls >> recvq >> sendq >> local >> peer)) return false;
    if (!ours || (proto == Protocol::UDP && !include_udp)) continue;
    std::string rest;
    std::getline(ls, rest);

    std::string addr;
    uint16_t port = 0;
    if (!split_local(local, addr, port)) return false;
    if (proto == Protocol::UDP && port == 0) continue;
    ++out.sockets_seen;

    std::vector<std::pair<int32_t, std::string>> owners;
    parse_users(rest, owners);
    if (owners.empty()) { ++out.hidden; continue; }
    for (auto& [pid, name] : owners) {
      pui::model::ListeningProcess lp;
      lp.pid = pid;
      lp.name = std::move(name);
      lp.port = port;
      lp.protocol = proto;
      lp.address = addr;
      out.entries.push_back(std::move(lp));
    }
  }
  return true;
}

bool SsPortScanner::scan(pui::model::PortSnapshot& out, ScanError& err) {
  if (path_.empty() && !init()) {
    err.message = "ss not found";
    return false;
  }
  std::string cmd = shell_quote(path_) + (include_udp_ ? " -H -l -n -t -u -p" : " -H -l -n -t -p") +
                    " 2>/dev/null";
  FILE* fp = ::popen(cmd.c_str(), "r");
  if (!fp) {
    err.message = std::string("cannot run ss: ") + std::strerror(errno);
    return false;
  }
  std::string text;
  char buf[1024];
  while (std::fgets(buf, sizeof(buf), fp)) text += buf;
  int status = ::pclose(fp);
  if (text.empty() && (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0)) {
    int code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    err.message = "ss exited with status " + std::to_string(code);
    return false;
  }

  pui::model::PortSnapshot snap;
  if (!parse_output(text, snap, include_udp_)) {
    err.message = "malformed ss output";
    return false;
  }
  // fill in names ss could not report
  for (auto& e : snap.entries) {
    if (e.name.empty()) e.name = resolver_.resolve(e.pid);
  }
  normalize_entries(snap.entries);
  out = std::move(snap);
  return true;
}

} // namespace pui::collectors

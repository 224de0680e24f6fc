#include "collectors/ProcessResolver.hpp"
#include "util/Procfs.hpp"
#include "util/Churn.hpp"

#include <charconv>
#include <cstdlib>

namespace pui::collectors {

bool ProcessResolver::parse_socket_inode(const std::string& link, uint64_t& inode) {
  static constexpr const char kPrefix[] = "socket:[";
  constexpr size_t plen = sizeof(kPrefix) - 1;
  if (link.size() <= plen + 1 || link.compare(0, plen, kPrefix) != 0 || link.back() != ']')
    return false;
  const char* first = link.data() + plen;
  const char* last = link.data() + link.size() - 1;
  uint64_t v = 0;
  auto [ptr, ec] = std::from_chars(first, last, v);
  if (ec != std::errc() || ptr != last) return false;
  inode = v;
  return true;
}

ProcessResolver::InodeOwners ProcessResolver::inode_owners() const {
  InodeOwners owners;
  for (const auto& pd : pui::util::list_dir("/proc")) {
    if (!pui::util::is_number(pd)) continue;
    int32_t pid = static_cast<int32_t>(std::strtol(pd.c_str(), nullptr, 10));
    std::string fd_dir = std::string("/proc/") + pd + "/fd";
    // Unreadable for other users' processes when unprivileged; skip quietly
    for (const auto& fd : pui::util::list_dir(fd_dir)) {
      if (!pui::util::is_number(fd)) continue;
      auto link = pui::util::read_symlink(fd_dir + "/" + fd);
      if (!link) continue;
      uint64_t inode = 0;
      if (!parse_socket_inode(*link, inode)) continue;
      auto it = owners.find(inode);
      if (it == owners.end()) owners.emplace(inode, pid);
      else if (pid < it->second) it->second = pid;
    }
  }
  return owners;
}

static std::string comm_from_stat(const std::string& content) {
  auto lp = content.find('(');
  auto rp = content.rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp) return {};
  return content.substr(lp + 1, rp - lp - 1);
}

std::string ProcessResolver::resolve(int32_t pid) const {
  if (pid <= 0) return {};
  std::string base = std::string("/proc/") + std::to_string(pid);
  if (auto comm = pui::util::read_file_string(base + "/comm")) {
    std::string name = *comm;
    while (!name.empty() && (name.back() == '\n' || name.back() == '\r')) name.pop_back();
    if (!name.empty()) return name;
  }
  if (auto stat = pui::util::read_file_string(base + "/stat")) {
    auto name = comm_from_stat(*stat);
    if (!name.empty()) return name;
  }
  // Exited between the socket scan and now
  pui::util::note_churn();
  return {};
}

} // namespace pui::collectors

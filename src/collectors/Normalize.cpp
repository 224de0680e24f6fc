#include "collectors/Normalize.hpp"
#include <algorithm>

namespace pui::collectors {

void normalize_entries(std::vector<pui::model::ListeningProcess>& entries) {
  auto key_less = [](const auto& a, const auto& b) {
    if (a.port != b.port) return a.port < b.port;
    if (a.protocol != b.protocol) return a.protocol == pui::model::Protocol::TCP;
    return a.pid < b.pid;
  };
  auto key_eq = [](const auto& a, const auto& b) {
    return a.port == b.port && a.protocol == b.protocol && a.pid == b.pid;
  };
  // stable so the first-seen address survives the unique pass
  std::stable_sort(entries.begin(), entries.end(), key_less);
  entries.erase(std::unique(entries.begin(), entries.end(), key_eq), entries.end());
}

} // namespace pui::collectors

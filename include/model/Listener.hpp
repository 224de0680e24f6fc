#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pui::model {

enum class Protocol { TCP, UDP };

inline const char* protocol_name(Protocol p) {
  return p == Protocol::TCP ? "TCP" : "UDP";
}

// One listening socket attributed to its owning process.
struct ListeningProcess {
  int32_t pid{};
  std::string name;     // empty when the owner could not be resolved
  uint16_t port{};
  Protocol protocol{Protocol::TCP};
  std::string address;  // local bind address, may be empty
};

inline bool operator==(const ListeningProcess& a, const ListeningProcess& b) {
  return a.pid == b.pid && a.port == b.port && a.protocol == b.protocol &&
         a.name == b.name && a.address == b.address;
}

struct PortSnapshot {
  std::vector<ListeningProcess> entries;
  size_t sockets_seen{}; // listening sockets found in the kernel tables
  size_t hidden{};       // sockets whose owner was not visible to us
};

} // namespace pui::model

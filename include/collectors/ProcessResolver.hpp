#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>

namespace pui::collectors {

// Attributes socket inodes to processes and pids to display names by
// walking /proc. Every lookup is best-effort: processes come and go while
// we read, and other users' fd tables are unreadable without privileges.
class ProcessResolver {
public:
  using InodeOwners = std::unordered_map<uint64_t, int32_t>;

  // Socket inode -> owning pid for every process whose fd table we can read.
  // When several processes share an inode (pre-fork servers) the lowest pid wins.
  [[nodiscard]] InodeOwners inode_owners() const;

  // Process display name from /proc/<pid>/comm, falling back to the command
  // in /proc/<pid>/stat. Empty string if the process is gone or unreadable.
  [[nodiscard]] std::string resolve(int32_t pid) const;

  // Parse an fd symlink target of the form "socket:[12345]".
  static bool parse_socket_inode(const std::string& link, uint64_t& inode);
};

} // namespace pui::collectors

#include "minitest.hpp"
#include "collectors/ProcNetScanner.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using pui::collectors::ProcNetScanner;
using pui::model::Protocol;

static const char* kTcpHeader =
  "  sl  local_address rem_address   st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode\n";

static fs::path make_root_procnet(const char* tag) {
  auto root = fs::temp_directory_path() / fs::path(std::string("pui_test_procnet_") + tag) /
              fs::path(std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "proc/net");
  return root;
}

static void add_socket_fd(const fs::path& root, int pid, int fd, unsigned long inode) {
  auto dir = root / "proc" / std::to_string(pid) / "fd";
  fs::create_directories(dir);
  fs::create_symlink("socket:[" + std::to_string(inode) + "]", dir / std::to_string(fd));
}

TEST(procnet_decode_ipv4_and_ipv6) {
  std::string out;
  ASSERT_TRUE(ProcNetScanner::decode_address("0100007F", false, out));
  ASSERT_EQ(out, std::string("127.0.0.1"));
  ASSERT_TRUE(ProcNetScanner::decode_address("00000000", false, out));
  ASSERT_EQ(out, std::string("0.0.0.0"));
  ASSERT_TRUE(ProcNetScanner::decode_address("00000000000000000000000000000000", true, out));
  ASSERT_EQ(out, std::string("::"));
  ASSERT_TRUE(ProcNetScanner::decode_address("00000000000000000000000001000000", true, out));
  ASSERT_EQ(out, std::string("::1"));
  ASSERT_TRUE(!ProcNetScanner::decode_address("0100007", false, out));
  ASSERT_TRUE(!ProcNetScanner::decode_address("ZZ00007F", false, out));
}

TEST(procnet_parse_table_filters_states) {
  std::string text = std::string(kTcpHeader) +
    "   0: 00000000:1F90 00000000:0000 0A 00000000:00000000 00:00000000 00000000  1000        0 1001 1 0000000000000000 100 0 0 10 0\n"
    "   1: 0100007F:1538 0100007F:D431 01 00000000:00000000 00:00000000 00000000  1000        0 1002 1 0000000000000000 20 4 30 10 -1\n";
  std::vector<ProcNetScanner::Row> rows;
  ASSERT_TRUE(ProcNetScanner::parse_table(text, Protocol::TCP, false, rows));
  ASSERT_EQ(rows.size(), (size_t)1);
  ASSERT_EQ(rows[0].port, (uint16_t)8080);
  ASSERT_EQ(rows[0].inode, (uint64_t)1001);
  ASSERT_EQ(rows[0].address, std::string("0.0.0.0"));

  std::vector<ProcNetScanner::Row> none;
  ASSERT_TRUE(!ProcNetScanner::parse_table("not a socket table\n", Protocol::TCP, false, none));
}

TEST(procnet_parse_udp_requires_unconnected_bound) {
  std::string text = std::string(kTcpHeader) +
    // bound, unconnected: a listener
    "   0: 00000000:0035 00000000:0000 07 00000000:00000000 00:00000000 00000000     0        0 2001 2 0000000000000000 0\n"
    // connected client socket
    "   1: 0100007F:C350 0100007F:0035 01 00000000:00000000 00:00000000 00000000  1000        0 2002 2 0000000000000000 0\n"
    // unbound
    "   2: 00000000:0000 00000000:0000 07 00000000:00000000 00:00000000 00000000  1000        0 2003 2 0000000000000000 0\n";
  std::vector<ProcNetScanner::Row> rows;
  ASSERT_TRUE(ProcNetScanner::parse_table(text, Protocol::UDP, false, rows));
  ASSERT_EQ(rows.size(), (size_t)1);
  ASSERT_EQ(rows[0].port, (uint16_t)53);
  ASSERT_TRUE(rows[0].protocol == Protocol::UDP);
}

TEST(procnet_scan_attributes_sorts_and_dedupes) {
  auto root = make_root_procnet("scan");
  std::ofstream(root / "proc/net/tcp") << kTcpHeader <<
    "   0: 00000000:1F90 00000000:0000 0A 00000000:00000000 00:00000000 00000000  1000        0 1001 1 0000000000000000 100 0 0 10 0\n"
    "   1: 0100007F:1538 00000000:0000 0A 00000000:00000000 00:00000000 00000000   999        0 1002 1 0000000000000000 100 0 0 10 0\n"
    "   2: 0100007F:1538 0100007F:D431 01 00000000:00000000 00:00000000 00000000   999        0 1003 1 0000000000000000 20 4 30 10 -1\n"
    "   3: 00000000:0016 00000000:0000 0A 00000000:00000000 00:00000000 00000000     0        0 1004 1 0000000000000000 100 0 0 10 0\n";
  std::ofstream(root / "proc/net/tcp6") << kTcpHeader <<
    "   0: 00000000000000000000000000000000:1F90 00000000000000000000000000000000:0000 0A 00000000:00000000 00:00000000 00000000  1000        0 1006 1 0000000000000000 100 0 0 10 0\n";
  std::ofstream(root / "proc/net/udp") << kTcpHeader <<
    "   0: 00000000:0035 00000000:0000 07 00000000:00000000 00:00000000 00000000     0        0 1005 2 0000000000000000 0\n";

  add_socket_fd(root, 100, 3, 1001);
  add_socket_fd(root, 100, 4, 1006);
  std::ofstream(root / "proc/100/comm") << "api\n";
  add_socket_fd(root, 200, 7, 1002);
  add_socket_fd(root, 200, 8, 1003);
  // no comm: name comes from stat
  std::ofstream(root / "proc/200/stat") << "200 (postgres) S 1 200 200 0 -1 4194560\n";
  add_socket_fd(root, 300, 5, 1005);
  std::ofstream(root / "proc/300/comm") << "dnsmasq\n";

  setenv("PUI_PROC_ROOT", root.c_str(), 1);
  ProcNetScanner sc(true);
  ASSERT_TRUE(sc.init());
  pui::model::PortSnapshot snap;
  pui::collectors::ScanError err;
  ASSERT_TRUE(sc.scan(snap, err));
  unsetenv("PUI_PROC_ROOT");

  ASSERT_EQ(snap.entries.size(), (size_t)3);
  ASSERT_EQ(snap.entries[0].port, (uint16_t)53);
  ASSERT_TRUE(snap.entries[0].protocol == Protocol::UDP);
  ASSERT_EQ(snap.entries[0].name, std::string("dnsmasq"));
  ASSERT_EQ(snap.entries[1].port, (uint16_t)5432);
  ASSERT_EQ(snap.entries[1].pid, 200);
  ASSERT_EQ(snap.entries[1].name, std::string("postgres"));
  ASSERT_EQ(snap.entries[1].address, std::string("127.0.0.1"));
  // v4 and v6 listeners of one process on one port collapse to one row
  ASSERT_EQ(snap.entries[2].port, (uint16_t)8080);
  ASSERT_EQ(snap.entries[2].pid, 100);
  ASSERT_EQ(snap.entries[2].name, std::string("api"));
  ASSERT_EQ(snap.entries[2].address, std::string("0.0.0.0"));

  ASSERT_EQ(snap.sockets_seen, (size_t)5);
  // port 22 has no visible owner
  ASSERT_EQ(snap.hidden, (size_t)(::geteuid() == 0 ? 0 : 1));
}

TEST(procnet_scan_without_udp) {
  auto root = make_root_procnet("noudp");
  std::ofstream(root / "proc/net/tcp") << kTcpHeader;
  std::ofstream(root / "proc/net/udp") << kTcpHeader <<
    "   0: 00000000:0035 00000000:0000 07 00000000:00000000 00:00000000 00000000     0        0 1005 2 0000000000000000 0\n";
  add_socket_fd(root, 300, 5, 1005);
  setenv("PUI_PROC_ROOT", root.c_str(), 1);
  ProcNetScanner sc(false);
  pui::model::PortSnapshot snap;
  pui::collectors::ScanError err;
  ASSERT_TRUE(sc.scan(snap, err));
  unsetenv("PUI_PROC_ROOT");
  ASSERT_TRUE(snap.entries.empty());
  ASSERT_EQ(snap.sockets_seen, (size_t)0);
}

TEST(procnet_scan_missing_tcp_table_is_error) {
  auto root = make_root_procnet("missing");
  setenv("PUI_PROC_ROOT", root.c_str(), 1);
  ProcNetScanner sc;
  ASSERT_TRUE(!sc.init());
  pui::model::PortSnapshot snap;
  pui::collectors::ScanError err;
  ASSERT_TRUE(!sc.scan(snap, err));
  unsetenv("PUI_PROC_ROOT");
  ASSERT_TRUE(!err.message.empty());
}

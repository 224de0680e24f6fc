#include "minitest.hpp"
#include "ui/Renderer.hpp"
#include "ui/Formatting.hpp"

using namespace pui::ui;
using pui::app::Action;
using pui::app::Session;
using pui::model::ListeningProcess;
using pui::model::Protocol;

namespace {

class FixedScanner : public pui::collectors::IPortScanner {
public:
  std::vector<ListeningProcess> entries;
  bool scan(pui::model::PortSnapshot& out, pui::collectors::ScanError&) override {
    out.entries = entries;
    return true;
  }
  const char* name() const override { return "fixed"; }
};

class NoopKiller : public pui::app::IProcessKiller {
public:
  bool terminate(int32_t, pui::app::KillError&) override { return true; }
};

std::vector<ListeningProcess> two_listeners() {
  return {
    {100, "api", 8080, Protocol::TCP, "0.0.0.0"},
    {200, "postgres", 5432, Protocol::TCP, "127.0.0.1"},
  };
}

bool contains(const std::string& s, const std::string& needle) {
  return s.find(needle) != std::string::npos;
}

} // namespace

TEST(render_scroll_offset_keeps_selection_visible) {
  ASSERT_EQ(scroll_offset(0, 30, 4), 0);
  ASSERT_EQ(scroll_offset(3, 30, 4), 0);
  ASSERT_EQ(scroll_offset(4, 30, 4), 1);
  ASSERT_EQ(scroll_offset(29, 30, 4), 26);
  ASSERT_EQ(scroll_offset(2, 3, 4), 0);
  ASSERT_EQ(scroll_offset(-1, 0, 4), 0);
}

TEST(render_row_format) {
  ListeningProcess p{200, "postgres", 5432, Protocol::TCP, "127.0.0.1"};
  Columns c = compute_columns({p}, 78, false);
  ASSERT_EQ(c.address, 0);
  auto row = format_row(p, c);
  ASSERT_EQ(display_cols(row), 78);
  ASSERT_TRUE(contains(row, "5432 TCP   200 postgres"));
  ListeningProcess anon{300, "", 53, Protocol::UDP, ""};
  ASSERT_TRUE(contains(format_row(anon, c), "53 UDP   300 unknown"));
}

TEST(render_narrow_terminal_drops_address) {
  auto items = two_listeners();
  Columns wide = compute_columns(items, 78, true);
  ASSERT_TRUE(wide.address >= 9);
  Columns narrow = compute_columns(items, 30, true);
  ASSERT_EQ(narrow.address, 0);
  ASSERT_TRUE(narrow.name >= 8);
}

TEST(render_frame_layout) {
  FixedScanner sc;
  sc.entries = two_listeners();
  NoopKiller k;
  Session s(sc, k);
  pui::collectors::ScanError err;
  ASSERT_TRUE(s.start(err));
  s.dispatch(Action::MoveDown);

  RenderOptions ro;
  Frame f = build_frame(s, ro, 80, 12);
  ASSERT_EQ(f.lines.size(), (size_t)12);
  for (const auto& ln : f.lines) ASSERT_EQ(display_cols(ln), 80);
  ASSERT_TRUE(contains(f.lines[0], "PUI - PORT PROCESS MANAGER"));
  ASSERT_TRUE(contains(f.lines[0], "scanner:fixed"));
  ASSERT_TRUE(!contains(f.lines[0], "races:"));
  ASSERT_TRUE(contains(f.lines[(size_t)f.table_top], "[ LISTENING PORTS ]"));
  ASSERT_TRUE(contains(f.lines[(size_t)f.header], "PORT PROTO"));
  ASSERT_TRUE(contains(f.lines[(size_t)f.header], "ADDRESS"));
  ASSERT_EQ(f.highlight, f.header + 2);
  ASSERT_TRUE(contains(f.lines[(size_t)f.highlight], "postgres"));
  ASSERT_TRUE(contains(f.lines[(size_t)f.status], "Found 2 process(es) listening on ports"));
  ASSERT_TRUE(!f.status_error);
  ASSERT_TRUE(contains(f.lines[(size_t)f.footer], "x kill"));

  ro.show_address = false;
  ro.churn = 3;
  Frame g = build_frame(s, ro, 80, 12);
  ASSERT_TRUE(!contains(g.lines[(size_t)g.header], "ADDRESS"));
  ASSERT_TRUE(contains(g.lines[0], "races:3"));
}

TEST(render_frame_scrolls_to_selection) {
  FixedScanner sc;
  for (int i = 0; i < 30; ++i)
    sc.entries.push_back({1000 + i, "svc" + std::to_string(i), (uint16_t)(9000 + i), Protocol::TCP, ""});
  NoopKiller k;
  Session s(sc, k);
  pui::collectors::ScanError err;
  ASSERT_TRUE(s.start(err));
  for (int i = 0; i < 10; ++i) s.dispatch(Action::MoveDown);
  Frame f = build_frame(s, RenderOptions{}, 60, 10);
  ASSERT_EQ(f.lines.size(), (size_t)10);
  ASSERT_EQ(f.highlight, f.header + 1 + 3);
  ASSERT_TRUE(contains(f.lines[(size_t)f.highlight], "svc10"));
  ASSERT_TRUE(contains(f.lines[(size_t)f.header + 1], "svc7"));
}

TEST(render_frame_empty_and_confirm) {
  FixedScanner sc;
  NoopKiller k;
  Session empty(sc, k);
  pui::collectors::ScanError err;
  ASSERT_TRUE(empty.start(err));
  Frame f = build_frame(empty, RenderOptions{}, 80, 12);
  ASSERT_EQ(f.highlight, -1);
  ASSERT_TRUE(contains(f.lines[(size_t)f.header + 1], "(no listening sockets)"));

  sc.entries = two_listeners();
  pui::app::SessionOptions opts;
  opts.confirm_kill = true;
  Session s(sc, k, opts);
  ASSERT_TRUE(s.start(err));
  s.dispatch(Action::Kill);
  Frame c = build_frame(s, RenderOptions{}, 100, 12);
  ASSERT_TRUE(contains(c.lines[(size_t)c.status],
                       "Kill process 'api' (PID: 100) on port 8080? [y] Yes  [n] No"));
  ASSERT_TRUE(contains(c.lines[(size_t)c.footer], "n/Esc cancel"));
}

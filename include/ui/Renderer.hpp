#pragma once

#include "app/Session.hpp"
#include "ui/Config.hpp"
#include <string>
#include <vector>

namespace pui::ui {

struct RenderOptions {
  bool show_address{true};
  int churn{0}; // recent /proc read races, shown when non-zero
};

// Column widths of the port table (interior of the box)
struct Columns {
  int port{5};
  int proto{5};
  int pid{7};
  int name{4};
  int address{0}; // 0: column hidden
};

// A fully laid out screen: plain text lines, each exactly `width` columns,
// plus the indices the painter needs to style.
struct Frame {
  std::vector<std::string> lines;
  int table_top{1};      // box top border
  int table_bottom{-1};  // box bottom border
  int header{2};
  int highlight{-1};     // selected row, -1 when nothing is selected
  int status{-1};
  bool status_error{false};
  int footer{-1};
};

// Box drawing
std::vector<std::string> make_box(
    const std::string& title,
    const std::vector<std::string>& lines,
    int width,
    int min_height = 0
);

Columns compute_columns(const std::vector<pui::model::ListeningProcess>& items,
                        int interior_width, bool show_address);

// "<port> <protocol> <pid> <name> [address]" padded to the column widths
std::string format_row(const pui::model::ListeningProcess& p, const Columns& c);
std::string format_header(const Columns& c);

// First visible row so that `selected` stays on a page of `page_rows`
int scroll_offset(int selected, int total, int page_rows);

// Pure projection of the session into a frame of width x height
Frame build_frame(const pui::app::Session& s, const RenderOptions& opts, int width, int height);

// Paint and write the frame to stdout in one write
void render_screen(const Frame& f, const Config::Colors& colors);

} // namespace pui::ui

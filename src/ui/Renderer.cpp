#include "ui/Renderer.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <unistd.h>
#include <algorithm>
#include <cstring>

namespace pui::ui {

using pui::app::SessionState;
using pui::model::ListeningProcess;

static constexpr const char* kTitle = "PUI - PORT PROCESS MANAGER";
static constexpr const char* kHelp = "j/k move  x kill  r refresh  q quit";
static constexpr const char* kConfirmHelp = "y/Enter confirm  n/Esc cancel  q quit";
// title, box top, header, box bottom, status, footer
static constexpr int kChromeRows = 6;

static std::string repeat_str(const std::string& ch, int n){
  std::string r;
  r.reserve(std::max(0,n* (int)ch.size()));
  for (int i=0;i<n;i++) r += ch;
  return r;
}

std::vector<std::string> make_box(const std::string& title, const std::vector<std::string>& lines, int width, int min_height) {
  int iw = std::max(3, width - 2);
  std::vector<std::string> out;
  const bool uni = use_unicode();
  const std::string TL = uni? "╭" : "+";
  const std::string TR = uni? "╮" : "+";
  const std::string BL = uni? "╰" : "+";
  const std::string BR = uni? "╯" : "+";
  const std::string H  = uni? "─" : "-";
  const std::string V  = uni? "│" : "|";
  auto top = [&]{
    std::string t = "[ " + title + " ]";
    int fill = std::max(0, iw - (int)t.size());
    int left = fill / 2; int right = fill - left;
    return TL + repeat_str(H, left) + t + repeat_str(H, right) + TR;
  }();
  out.push_back(top);
  int content_lines = std::max((int)lines.size(), min_height);
  for (int i = 0; i < content_lines; ++i) {
    std::string ln = (i < (int)lines.size()) ? lines[i] : std::string();
    out.push_back(V + trunc_pad(ln, iw) + V);
  }
  out.push_back(BL + repeat_str(H, iw) + BR);
  return out;
}

Columns compute_columns(const std::vector<ListeningProcess>& items, int interior_width, bool show_address) {
  Columns c;
  int pid_w = 3;
  int addr_w = 7; // "ADDRESS"
  for (const auto& p : items) {
    pid_w = std::max(pid_w, (int)std::to_string(p.pid).size());
    addr_w = std::max(addr_w, display_cols(p.address));
  }
  c.pid = std::min(pid_w, 7);
  c.address = show_address ? std::min(addr_w, 39) : 0;
  // leading space + three separators before the name
  int fixed = 1 + c.port + 1 + c.proto + 1 + c.pid + 1;
  c.name = interior_width - fixed - (c.address > 0 ? c.address + 1 : 0);
  if (c.name < 8 && c.address > 0) {
    // Narrow terminal: the name matters more than the bind address
    c.address = 0;
    c.name = interior_width - fixed;
  }
  c.name = std::max(c.name, 4);
  return c;
}

static std::string compose(const Columns& c, const std::string& port, const std::string& proto,
                           const std::string& pid, const std::string& name, const std::string& addr) {
  std::string s = " " + rpad_trunc(port, c.port) + " " + trunc_pad(proto, c.proto) + " " +
                  rpad_trunc(pid, c.pid) + " " + trunc_pad(name, c.name);
  if (c.address > 0) s += " " + trunc_pad(addr, c.address);
  return s;
}

std::string format_row(const ListeningProcess& p, const Columns& c) {
  return compose(c, std::to_string(p.port), pui::model::protocol_name(p.protocol),
                 std::to_string(p.pid), p.name.empty() ? std::string("unknown") : p.name,
                 p.address);
}

std::string format_header(const Columns& c) {
  return compose(c, "PORT", "PROTO", "PID", "NAME", "ADDRESS");
}

int scroll_offset(int selected, int total, int page_rows) {
  if (page_rows <= 0 || total <= page_rows || selected < 0) return 0;
  int off = std::max(0, selected - page_rows + 1);
  return std::min(off, total - page_rows);
}

static std::string confirm_prompt(const ListeningProcess& p) {
  std::string name = p.name.empty() ? std::string("unknown") : p.name;
  return "Kill process '" + name + "' (PID: " + std::to_string(p.pid) + ") on port " +
         std::to_string(p.port) + "? [y] Yes  [n] No";
}

Frame build_frame(const pui::app::Session& s, const RenderOptions& opts, int width, int height) {
  Frame f;
  width = std::max(width, 20);
  const int page = std::max(1, height - kChromeRows);
  const auto& model = s.model();
  const auto& items = model.items();
  const int iw = width - 2;

  std::string right = std::string("scanner:") + s.scanner_name();
  if (opts.churn > 0) right += "  races:" + std::to_string(opts.churn);
  f.lines.push_back(lr_align(width, std::string(" ") + kTitle, right + " "));

  Columns cols = compute_columns(items, iw, opts.show_address);
  std::vector<std::string> body;
  body.push_back(format_header(cols));
  int off = scroll_offset(model.selected(), (int)items.size(), page);
  if (items.empty()) {
    body.push_back(" (no listening sockets)");
  } else {
    int end = std::min((int)items.size(), off + page);
    for (int i = off; i < end; ++i) body.push_back(format_row(items[(size_t)i], cols));
  }
  auto box = make_box("LISTENING PORTS", body, width, page + 1);
  f.table_top = (int)f.lines.size();
  f.header = f.table_top + 1;
  if (model.selected() >= 0) f.highlight = f.header + 1 + (model.selected() - off);
  f.lines.insert(f.lines.end(), box.begin(), box.end());
  f.table_bottom = (int)f.lines.size() - 1;

  f.status = (int)f.lines.size();
  if (s.state() == SessionState::ConfirmingKill && s.pending_kill()) {
    f.lines.push_back(trunc_pad(" " + confirm_prompt(*s.pending_kill()), width));
    f.status_error = true;
  } else {
    f.lines.push_back(trunc_pad(" " + s.status(), width));
    f.status_error = s.status_level() == pui::app::StatusLevel::Error;
  }

  f.footer = (int)f.lines.size();
  const char* help = s.state() == SessionState::ConfirmingKill ? kConfirmHelp : kHelp;
  f.lines.push_back(trunc_pad(std::string(" ") + help, width));
  return f;
}

// Split a boxed row into its side borders and interior so each can be styled
static std::string paint_box_row(const std::string& s, const std::string& border,
                                 const std::string& interior_sgr) {
  const char* V = use_unicode() ? "│" : "|";
  const size_t vlen = std::strlen(V);
  size_t fpos = s.find(V);
  size_t lpos = s.rfind(V);
  if (fpos == std::string::npos || lpos == std::string::npos || lpos <= fpos) return s;
  std::string mid = s.substr(fpos + vlen, lpos - (fpos + vlen));
  return border + s.substr(0, fpos + vlen) + sgr_reset() + interior_sgr + mid + sgr_reset() +
         border + s.substr(lpos) + sgr_reset();
}

static std::string paint_border(const std::string& s, const Config::Colors& colors) {
  size_t lb = s.find('[');
  size_t rb = (lb!=std::string::npos) ? s.find(']', lb+1) : std::string::npos;
  if (lb != std::string::npos && rb != std::string::npos && rb > lb) {
    return colors.border + s.substr(0, lb) + colors.accent + s.substr(lb, rb - lb + 1) +
           colors.border + s.substr(rb + 1) + sgr_reset();
  }
  return colors.border + s + sgr_reset();
}

void render_screen(const Frame& f, const Config::Colors& colors) {
  std::string frame;
  frame.reserve(f.lines.size() * 128 + 64);
  frame += "\x1B[H";
  for (int i = 0; i < (int)f.lines.size(); ++i) {
    const auto& ln = f.lines[(size_t)i];
    std::string painted;
    if (i == 0) painted = sgr_bold() + colors.accent + ln + sgr_reset();
    else if (i == f.table_top || i == f.table_bottom) painted = paint_border(ln, colors);
    else if (i == f.header) painted = paint_box_row(ln, colors.border, sgr_bold());
    else if (i == f.highlight) painted = paint_box_row(ln, colors.border, sgr_reverse());
    else if (i > f.header && i < f.table_bottom) painted = paint_box_row(ln, colors.border, std::string());
    else if (i == f.status) painted = (f.status_error ? colors.warning : std::string()) + ln + sgr_reset();
    else if (i == f.footer) painted = colors.muted + ln + sgr_reset();
    else painted = ln;
    frame += painted;
    if (i + 1 < (int)f.lines.size()) frame += "\r\n";
  }
  // Clear anything below a frame that shrank since the last draw
  frame += "\x1B[J";
  best_effort_write(STDOUT_FILENO, frame.data(), frame.size());
}

} // namespace pui::ui

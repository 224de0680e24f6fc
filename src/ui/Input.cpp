#include "ui/Input.hpp"
#include <unistd.h>
#include <poll.h>

namespace pui::ui {

using pui::app::Action;

bool has_input_available(int timeout_ms) {
  struct pollfd pfd{.fd=STDIN_FILENO,.events=POLLIN,.revents=0};
  int to = timeout_ms;
  if (to < 10) to = 10;
  if (to > 1000) to = 1000;
  int rv = ::poll(&pfd, 1, to);
  return rv > 0 && (pfd.revents & POLLIN);
}

std::vector<Action> decode_keys(const unsigned char* buf, size_t n) {
  std::vector<Action> out;
  size_t k = 0;
  while (k < n) {
    unsigned char c = buf[k++];
    if (c == 'q' || c == 'Q') { out.push_back(Action::Quit); }
    else if (c == 'j' || c == 'J') { out.push_back(Action::MoveDown); }
    else if (c == 'k' || c == 'K') { out.push_back(Action::MoveUp); }
    else if (c == 'x' || c == 'X') { out.push_back(Action::Kill); }
    else if (c == 'r' || c == 'R') { out.push_back(Action::Refresh); }
    else if (c == 'y' || c == 'Y' || c == '\r' || c == '\n') { out.push_back(Action::Confirm); }
    else if (c == 'n' || c == 'N') { out.push_back(Action::Cancel); }
    else if (c == 0x1B) {
      // ESC [ A/B (normal cursor keys) or ESC O A/B (application mode); bare ESC cancels
      if (k >= n || (buf[k] != '[' && buf[k] != 'O')) { out.push_back(Action::Cancel); continue; }
      ++k;
      if (k >= n) break;
      unsigned char b = buf[k++];
      if (b == 'A') out.push_back(Action::MoveUp);
      else if (b == 'B') out.push_back(Action::MoveDown);
      else {
        // Skip the rest of longer sequences (ESC [ 5 ~ and friends)
        while (k < n && !(buf[k] >= '@' && buf[k] <= '~')) ++k;
        if (b >= '0' && b <= '9' && k < n) ++k;
      }
    }
  }
  return out;
}

std::vector<Action> read_actions() {
  unsigned char buf[64];
  ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
  if (n <= 0) return {};
  return decode_keys(buf, static_cast<size_t>(n));
}

} // namespace pui::ui

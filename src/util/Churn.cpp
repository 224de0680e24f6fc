#include "util/Churn.hpp"

#include <algorithm>
#include <chrono>
#include <deque>

namespace pui::util {

using Clock = std::chrono::steady_clock;

static constexpr auto kHorizon = std::chrono::seconds(60);

// Monotonic timestamps, oldest first
static std::deque<Clock::time_point>& races() {
  static std::deque<Clock::time_point> q;
  return q;
}

static void expire(Clock::time_point now) {
  auto& q = races();
  while (!q.empty() && now - q.front() > kHorizon) q.pop_front();
}

void note_churn() {
  auto now = Clock::now();
  expire(now);
  races().push_back(now);
}

int count_recent_ms(int ms) {
  auto now = Clock::now();
  expire(now);
  const auto& q = races();
  auto first = std::lower_bound(q.begin(), q.end(), now - std::chrono::milliseconds(ms));
  return static_cast<int>(q.end() - first);
}

} // namespace pui::util

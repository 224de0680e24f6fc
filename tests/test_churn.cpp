#include "minitest.hpp"
#include "util/Churn.hpp"
#include <chrono>
#include <thread>

TEST(churn_counts_recent_races) {
  int before = pui::util::count_recent_ms(60000);
  pui::util::note_churn();
  pui::util::note_churn();
  ASSERT_EQ(pui::util::count_recent_ms(60000), before + 2);
}

TEST(churn_window_excludes_older_races) {
  pui::util::note_churn();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  // only races from the last 10ms: nothing noted since the sleep
  ASSERT_EQ(pui::util::count_recent_ms(10), 0);
  pui::util::note_churn();
  ASSERT_EQ(pui::util::count_recent_ms(10), 1);
}

// Read races seen while walking /proc: a process or socket that vanished
// between being listed and being read. Shown as races:N in the title bar.
#pragma once

namespace pui::util {

void note_churn();

// Races recorded in the last ms milliseconds (window capped at 60s)
[[nodiscard]] int count_recent_ms(int ms);

} // namespace pui::util

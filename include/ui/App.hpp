#pragma once

#include "app/Session.hpp"
#include "ui/Config.hpp"
#include <string>

namespace pui::ui {

// Run the session: initial scan, then the full-screen draw/input loop until
// quit or SIGINT. Returns the exit status. On failure `fatal` holds the
// message; the terminal is already restored when this returns, so the
// caller prints it to stderr. A failed initial scan returns before any
// terminal state is changed.
int run_interactive(pui::app::Session& session, const Config& cfg, std::string& fatal);

} // namespace pui::ui

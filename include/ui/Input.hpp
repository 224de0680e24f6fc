#pragma once

#include "app/Session.hpp"
#include <cstddef>
#include <vector>

namespace pui::ui {

// Decode raw terminal bytes into actions. Fixed bindings:
// j/Down, k/Up, x kill, r refresh, q quit, y/Enter confirm, n/Esc cancel.
std::vector<pui::app::Action> decode_keys(const unsigned char* buf, size_t n);

// Wait up to timeout_ms for stdin to become readable
bool has_input_available(int timeout_ms);

// Read whatever is pending on stdin and decode it. Empty when nothing arrived.
std::vector<pui::app::Action> read_actions();

} // namespace pui::ui

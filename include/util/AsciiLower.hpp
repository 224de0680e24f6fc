#pragma once

namespace pui::util {

// Locale-independent lowercase for ASCII letters; other bytes pass through.
constexpr char ascii_lower(unsigned char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
}

} // namespace pui::util

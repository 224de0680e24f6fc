#pragma once

#include <string>

namespace pui::ui {

// UTF-8 text width utilities (SGR sequences count as zero columns)
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Text formatting and alignment
std::string trunc_pad(const std::string& s, int w);
std::string rpad_trunc(const std::string& s, int w);
std::string lr_align(int iw, const std::string& left, const std::string& right);

} // namespace pui::ui

#pragma once

#include <string>

namespace pui::ui {

struct Config {
  // SGR sequences resolved from [roles]; empty when stdout is not a TTY
  struct Colors {
    std::string accent;
    std::string warning;
    std::string muted;
    std::string border;
  } colors;

  struct Ui {
    bool alt_screen{true};
    bool confirm_kill{false};
    bool show_address{true};
  } ui;

  struct Scan {
    std::string scanner{"auto"};
    bool include_udp{true};
    std::string ss_path;
  } scan;

  struct Log {
    std::string file;
  } log;
};

// $XDG_CONFIG_HOME/pui/config.toml or ~/.config/pui/config.toml; empty if neither is known
std::string config_file_path();

// Resolve every key from TOML -> env -> compiled default. A missing or
// unreadable file is not an error: env and defaults still apply.
Config load_config(const std::string& path);

// Environment variable helpers
const char* getenv_compat(const char* name);
bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b);

} // namespace pui::ui

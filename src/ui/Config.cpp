#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include "util/TomlReader.hpp"
#include <cctype>
#include <cstdlib>
#include <string>

namespace pui::ui {

bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b) {
  if (hex.size()!=7 || hex[0] != '#') return false;
  auto hexv = [&](char c)->int{
    if (c>='0'&&c<='9') return c-'0';
    if (c>='a'&&c<='f') return c-'a'+10;
    if (c>='A'&&c<='F') return c-'A'+10;
    return -1;
  };
  int v1=hexv(hex[1]), v2=hexv(hex[2]), v3=hexv(hex[3]), v4=hexv(hex[4]), v5=hexv(hex[5]), v6=hexv(hex[6]);
  if (v1<0||v2<0||v3<0||v4<0||v5<0||v6<0) return false;
  r = v1*16+v2; g = v3*16+v4; b = v5*16+v6;
  return true;
}

// Accept both PUI_ and pui_ prefixes
const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("PUI_", 0) == 0) {
    alt = std::string("pui_") + n.substr(4);
  } else if (n.rfind("pui_", 0) == 0) {
    alt = std::string("PUI_") + n.substr(4);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/pui/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/pui/config.toml";
  return {};
}

// Resolve a color role from TOML -> compiled default.
// TOML value can be integer (palette index) or "#RRGGBB" (hex override).
static std::string resolve_color(const pui::util::TomlReader& toml, bool have_toml,
                                 const char* role, int def_palette_idx,
                                 const char* def_hex) {
  if (have_toml && toml.has("roles", role)) {
    std::string val = toml.get_string("roles", role);
    if (!val.empty() && (std::isdigit(static_cast<unsigned char>(val[0])) || val[0]=='-')) {
      int idx = def_palette_idx;
      try { idx = std::stoi(val); } catch (const std::exception&) { idx = def_palette_idx; }
      return sgr_palette_idx(idx);
    }
    int r, g, b;
    if (parse_hex_rgb(val, r, g, b)) return sgr_truecolor(r, g, b);
  }
  if (def_hex && def_hex[0] == '#') {
    int r, g, b;
    if (parse_hex_rgb(std::string(def_hex), r, g, b)) return sgr_truecolor(r, g, b);
  }
  return sgr_palette_idx(def_palette_idx);
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const pui::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const pui::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

Config load_config(const std::string& path) {
  Config c{};
  pui::util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  // --- [roles] ---
  c.colors.accent  = resolve_color(toml, have_toml, "accent",  11, nullptr);
  c.colors.warning = resolve_color(toml, have_toml, "warning",  1, nullptr);
  c.colors.muted   = resolve_color(toml, have_toml, "muted",   -1, "#787878");
  c.colors.border  = resolve_color(toml, have_toml, "border",  -1, "#383838");

  // --- [ui] ---
  c.ui.alt_screen   = resolve_bool(toml, have_toml, "ui", "alt_screen",   "PUI_ALT_SCREEN", true);
  c.ui.confirm_kill = resolve_bool(toml, have_toml, "ui", "confirm_kill", "PUI_CONFIRM_KILL", false);
  c.ui.show_address = resolve_bool(toml, have_toml, "ui", "show_address", "PUI_SHOW_ADDRESS", true);

  // --- [scan] ---
  c.scan.scanner     = resolve_string(toml, have_toml, "scan", "scanner",     "PUI_SCANNER", "auto");
  c.scan.include_udp = resolve_bool(toml, have_toml,   "scan", "include_udp", "PUI_INCLUDE_UDP", true);
  c.scan.ss_path     = resolve_string(toml, have_toml, "scan", "ss_path",     "PUI_SS_PATH", "");

  // --- [log] ---
  c.log.file = resolve_string(toml, have_toml, "log", "file", "PUI_LOG_FILE", "");

  return c;
}

} // namespace pui::ui

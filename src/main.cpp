#include "app/EventLog.hpp"
#include "app/ProcessKiller.hpp"
#include "app/ScannerSelect.hpp"
#include "app/Session.hpp"
#include "ui/Config.hpp"
#include "ui/App.hpp"
#include "ui/Terminal.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <unistd.h>

static constexpr const char* kVersion = "0.1.0";

static void print_usage(std::FILE* out) {
  std::fprintf(out,
               "Usage: pui [--scanner auto|procfs|ss] [--config PATH] [--log PATH] [-h|--help] [--version]\n"
               "Keys: j/k or arrows move  x kill (SIGTERM)  r refresh  q quit\n"
               "Notes: run as root to see and kill other users' processes.\n");
}

struct CliOptions {
  std::string scanner;     // empty: use config
  std::string config_path; // empty: default location
  std::string log_path;    // empty: use config
  bool help{false};
  bool version{false};
};

// Returns false on a usage error (message already printed)
static bool parse_args(int argc, char** argv, CliOptions& o) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto value = [&](std::string& dst) -> bool {
      if (i + 1 >= argc) {
        std::fprintf(stderr, "pui: %s requires an argument\n", a.c_str());
        return false;
      }
      dst = argv[++i];
      return true;
    };
    if (a == "--scanner") {
      if (!value(o.scanner)) return false;
      if (o.scanner != "auto" && o.scanner != "procfs" && o.scanner != "ss") {
        std::fprintf(stderr, "pui: unknown scanner '%s'\n", o.scanner.c_str());
        return false;
      }
    } else if (a == "--config") {
      if (!value(o.config_path)) return false;
    } else if (a == "--log") {
      if (!value(o.log_path)) return false;
    } else if (a == "-h" || a == "--help") {
      o.help = true;
    } else if (a == "--version") {
      o.version = true;
    } else {
      std::fprintf(stderr, "pui: unknown option '%s'\n", a.c_str());
      return false;
    }
  }
  return true;
}

int main(int argc, char** argv) {
  CliOptions cli;
  if (!parse_args(argc, argv, cli)) {
    print_usage(stderr);
    return 2;
  }
  if (cli.help) { print_usage(stdout); return 0; }
  if (cli.version) { std::printf("pui %s\n", kVersion); return 0; }

  std::string cfg_path = cli.config_path.empty() ? pui::ui::config_file_path() : cli.config_path;
  pui::ui::Config cfg = pui::ui::load_config(cfg_path);
  if (!cli.scanner.empty()) cfg.scan.scanner = cli.scanner;
  if (!cli.log_path.empty()) cfg.log.file = cli.log_path;

  pui::app::EventLog log;
  if (!cfg.log.file.empty()) (void)log.open(cfg.log.file);

  auto choice = pui::app::select_port_scanner(cfg.scan.scanner, cfg.scan.include_udp, cfg.scan.ss_path);
  if (!choice.scanner) {
    std::fprintf(stderr, "pui: %s\n", choice.note.c_str());
    return 1;
  }
  if (!choice.note.empty()) std::fprintf(stderr, "pui: %s\n", choice.note.c_str());
  if (log.enabled()) {
    log.logf("pui %s started, scanner=%s%s%s", kVersion, choice.scanner->name(),
             choice.note.empty() ? "" : ", ", choice.note.c_str());
  }

  if (!pui::ui::tty_stdin() || !pui::ui::tty_stdout()) {
    std::fprintf(stderr, "pui: stdin and stdout must be a terminal\n");
    return 1;
  }

  pui::app::SignalKiller killer;
  pui::app::SessionOptions opts;
  opts.confirm_kill = cfg.ui.confirm_kill;
  pui::app::Session session(*choice.scanner, killer, opts, log.enabled() ? &log : nullptr);

  std::string fatal;
  int rc = pui::ui::run_interactive(session, cfg, fatal);
  // Guards are gone; the terminal is back in cooked mode
  if (!fatal.empty()) std::fprintf(stderr, "pui: %s\n", fatal.c_str());
  if (log.enabled()) log.logf("pui exiting with status %d", rc);
  return rc;
}

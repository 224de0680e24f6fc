#include "app/Session.hpp"
#include "app/EventLog.hpp"

#include <chrono>

namespace pui::app {

using pui::model::ListeningProcess;

static std::string display_name(const ListeningProcess& p) {
  return p.name.empty() ? std::string("unknown") : p.name;
}

Session::Session(pui::collectors::IPortScanner& scanner, IProcessKiller& killer,
                 SessionOptions opts, EventLog* log)
  : scanner_(scanner), killer_(killer), opts_(opts), log_(log) {}

bool Session::start(pui::collectors::ScanError& err) {
  pui::model::PortSnapshot snap;
  if (!scanner_.scan(snap, err)) {
    if (log_) log_->logf("startup scan failed (%s): %s", scanner_.name(), err.message.c_str());
    return false;
  }
  hidden_ = snap.hidden;
  model_.refresh(std::move(snap.entries));
  if (log_) log_->logf("startup scan (%s): %zu entries, %zu hidden",
                       scanner_.name(), model_.size(), hidden_);
  announce_snapshot();
  return true;
}

void Session::announce_snapshot() {
  if (model_.empty()) {
    set_status("No processes listening on ports found (may require sudo)", StatusLevel::Info);
  } else {
    set_status("Found " + std::to_string(model_.size()) + " process(es) listening on ports",
               StatusLevel::Info);
  }
  if (hidden_ > 0)
    status_ += " (" + std::to_string(hidden_) + " hidden, run as root to see all)";
}

void Session::set_status(std::string msg, StatusLevel level) {
  status_ = std::move(msg);
  status_level_ = level;
}

void Session::clear_error_status() {
  if (status_level_ == StatusLevel::Error) set_status({}, StatusLevel::Info);
}

// announce=false keeps the current status line (e.g. "Terminated ...")
void Session::refresh(bool announce) {
  pui::model::PortSnapshot snap;
  pui::collectors::ScanError err;
  auto t0 = std::chrono::steady_clock::now();
  if (!scanner_.scan(snap, err)) {
    if (log_) log_->logf("refresh failed (%s): %s", scanner_.name(), err.message.c_str());
    set_status("Refresh failed: " + err.message, StatusLevel::Error);
    return;
  }
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - t0).count();
  hidden_ = snap.hidden;
  model_.refresh(std::move(snap.entries));
  if (log_) log_->logf("refresh (%s): %zu entries, %zu hidden, %lldms",
                       scanner_.name(), model_.size(), hidden_, static_cast<long long>(ms));
  if (announce) announce_snapshot();
}

void Session::request_kill() {
  auto sel = model_.current_selection();
  if (!sel) {
    set_status("No processes to kill", StatusLevel::Error);
    return;
  }
  if (opts_.confirm_kill) {
    pending_ = std::move(sel);
    state_ = SessionState::ConfirmingKill;
    return;
  }
  kill_target(*sel);
}

void Session::kill_target(const ListeningProcess& target) {
  const std::string name = display_name(target);
  KillError err;
  if (!killer_.terminate(target.pid, err)) {
    if (log_) log_->logf("kill %d (%s) failed: %s", target.pid, name.c_str(), err.message.c_str());
    switch (err.reason) {
      case KillFailure::NoSuchProcess:
        set_status("Process " + std::to_string(target.pid) + " no longer exists", StatusLevel::Error);
        break;
      case KillFailure::PermissionDenied:
        set_status("Permission denied: cannot kill '" + name + "' (PID: " +
                   std::to_string(target.pid) + ")", StatusLevel::Error);
        break;
      case KillFailure::Other:
        set_status("Error killing process: " + err.message, StatusLevel::Error);
        break;
    }
    return;
  }
  if (log_) log_->logf("sent SIGTERM to %d (%s) on %s/%u", target.pid, name.c_str(),
                       pui::model::protocol_name(target.protocol), static_cast<unsigned>(target.port));
  set_status("Terminated '" + name + "' (PID: " + std::to_string(target.pid) + ")", StatusLevel::Info);
  refresh(false);
}

void Session::dispatch(Action a) {
  if (a == Action::Quit) { state_ = SessionState::Exiting; return; }
  switch (state_) {
    case SessionState::Exiting:
      return;
    case SessionState::ConfirmingKill: {
      if (a == Action::Confirm) {
        auto target = std::move(pending_);
        pending_.reset();
        state_ = SessionState::Viewing;
        if (target) kill_target(*target);
      } else if (a == Action::Cancel) {
        pending_.reset();
        state_ = SessionState::Viewing;
        set_status("Kill cancelled", StatusLevel::Info);
      }
      return;
    }
    case SessionState::Viewing:
      break;
  }
  switch (a) {
    case Action::MoveDown: model_.move_selection(+1); clear_error_status(); break;
    case Action::MoveUp:   model_.move_selection(-1); clear_error_status(); break;
    case Action::Refresh:  refresh(true); break;
    case Action::Kill:     request_kill(); break;
    case Action::Confirm:
    case Action::Cancel:
    case Action::Quit:
      break;
  }
}

void Session::dispatch_batch(const std::vector<Action>& actions) {
  bool prev_refresh = false;
  for (Action a : actions) {
    if (should_exit()) return;
    bool is_refresh = (a == Action::Refresh);
    if (!(is_refresh && prev_refresh)) dispatch(a);
    prev_refresh = is_refresh;
  }
}

} // namespace pui::app

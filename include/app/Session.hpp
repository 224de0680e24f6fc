#pragma once
#include "app/ListModel.hpp"
#include "app/ProcessKiller.hpp"
#include "collectors/IPortScanner.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pui::app {

class EventLog;

// Operator intents decoded from key presses
enum class Action { MoveDown, MoveUp, Kill, Refresh, Quit, Confirm, Cancel };

enum class SessionState { Viewing, ConfirmingKill, Exiting };

enum class StatusLevel { Info, Error };

struct SessionOptions {
  bool confirm_kill{false}; // ask y/n before signalling
};

// Action dispatcher: owns the list model and drives scanner and killer from
// operator actions. Single-threaded; every call completes synchronously.
class Session {
public:
  Session(pui::collectors::IPortScanner& scanner, IProcessKiller& killer,
          SessionOptions opts = {}, EventLog* log = nullptr);

  // Initial scan. A false return is fatal for the caller: there is no
  // previous snapshot to fall back to.
  [[nodiscard]] bool start(pui::collectors::ScanError& err);

  void dispatch(Action a);
  // Dispatch one input batch; consecutive Refresh actions collapse to one
  // so key repeat queued during a slow scan does not rescan over and over.
  void dispatch_batch(const std::vector<Action>& actions);

  // SIGINT and friends
  void request_quit() { state_ = SessionState::Exiting; }

  [[nodiscard]] SessionState state() const { return state_; }
  [[nodiscard]] bool should_exit() const { return state_ == SessionState::Exiting; }
  [[nodiscard]] const ListModel& model() const { return model_; }
  [[nodiscard]] const std::string& status() const { return status_; }
  [[nodiscard]] StatusLevel status_level() const { return status_level_; }
  // Target of the pending confirmation prompt (ConfirmingKill only)
  [[nodiscard]] const std::optional<pui::model::ListeningProcess>& pending_kill() const { return pending_; }
  [[nodiscard]] size_t hidden() const { return hidden_; }
  [[nodiscard]] const char* scanner_name() const { return scanner_.name(); }

private:
  void refresh(bool announce);
  void announce_snapshot();
  void request_kill();
  void kill_target(const pui::model::ListeningProcess& target);
  void set_status(std::string msg, StatusLevel level);
  void clear_error_status();

  pui::collectors::IPortScanner& scanner_;
  IProcessKiller& killer_;
  SessionOptions opts_;
  EventLog* log_{nullptr};

  ListModel model_;
  SessionState state_{SessionState::Viewing};
  std::string status_;
  StatusLevel status_level_{StatusLevel::Info};
  std::optional<pui::model::ListeningProcess> pending_;
  size_t hidden_{0};
};

} // namespace pui::app

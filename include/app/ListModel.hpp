#pragma once
#include "model/Listener.hpp"
#include <optional>
#include <vector>

namespace pui::app {

// Current snapshot plus the highlighted row. Selection is positional: a
// refresh keeps the index (clamped), not the record.
class ListModel {
public:
  static constexpr int kNoSelection = -1;

  // Replace all items, preserving their order, and clamp the selection.
  void refresh(std::vector<pui::model::ListeningProcess> items);

  // Move by delta rows, clamped to the list bounds (no wraparound).
  void move_selection(int delta);

  [[nodiscard]] std::optional<pui::model::ListeningProcess> current_selection() const;

  [[nodiscard]] const std::vector<pui::model::ListeningProcess>& items() const { return items_; }
  [[nodiscard]] int selected() const { return selected_; }
  [[nodiscard]] size_t size() const { return items_.size(); }
  [[nodiscard]] bool empty() const { return items_.empty(); }

private:
  std::vector<pui::model::ListeningProcess> items_;
  int selected_{kNoSelection};
};

} // namespace pui::app

#include "app/ListModel.hpp"
#include <algorithm>

namespace pui::app {

void ListModel::refresh(std::vector<pui::model::ListeningProcess> items) {
  items_ = std::move(items);
  if (items_.empty()) { selected_ = kNoSelection; return; }
  int last = static_cast<int>(items_.size()) - 1;
  selected_ = std::clamp(selected_, 0, last);
}

void ListModel::move_selection(int delta) {
  if (items_.empty()) return;
  int last = static_cast<int>(items_.size()) - 1;
  selected_ = std::clamp(selected_ + delta, 0, last);
}

std::optional<pui::model::ListeningProcess> ListModel::current_selection() const {
  if (selected_ < 0 || selected_ >= static_cast<int>(items_.size())) return std::nullopt;
  return items_[static_cast<size_t>(selected_)];
}

} // namespace pui::app

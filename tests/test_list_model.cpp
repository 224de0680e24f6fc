#include "minitest.hpp"
#include "app/ListModel.hpp"

using pui::app::ListModel;
using pui::model::ListeningProcess;
using pui::model::Protocol;

static std::vector<ListeningProcess> make_items(int n) {
  std::vector<ListeningProcess> v;
  for (int i = 0; i < n; ++i)
    v.push_back(ListeningProcess{100 + i, "svc" + std::to_string(i), (uint16_t)(8000 + i), Protocol::TCP, "0.0.0.0"});
  return v;
}

TEST(list_model_starts_empty) {
  ListModel m;
  ASSERT_TRUE(m.empty());
  ASSERT_EQ(m.selected(), ListModel::kNoSelection);
  ASSERT_TRUE(!m.current_selection().has_value());
  m.move_selection(1);
  ASSERT_EQ(m.selected(), ListModel::kNoSelection);
}

TEST(list_model_refresh_selects_first_and_keeps_order) {
  ListModel m;
  std::vector<ListeningProcess> items{
    {100, "api", 8080, Protocol::TCP, ""},
    {200, "postgres", 5432, Protocol::TCP, ""},
  };
  m.refresh(items);
  ASSERT_EQ(m.selected(), 0);
  ASSERT_EQ(m.items()[0].port, (uint16_t)8080);
  ASSERT_EQ(m.items()[1].port, (uint16_t)5432);
  ASSERT_EQ(m.current_selection()->name, std::string("api"));
}

TEST(list_model_no_wraparound) {
  ListModel m;
  m.refresh(make_items(3));
  m.move_selection(-1);
  ASSERT_EQ(m.selected(), 0);
  m.move_selection(1);
  m.move_selection(1);
  ASSERT_EQ(m.selected(), 2);
  m.move_selection(1);
  ASSERT_EQ(m.selected(), 2);
  m.move_selection(-10);
  ASSERT_EQ(m.selected(), 0);
}

TEST(list_model_refresh_clamps_selection) {
  ListModel m;
  for (int n : {5, 2, 0, 1, 4, 3}) {
    m.move_selection(100);
    m.refresh(make_items(n));
    m.move_selection(0);
    if (n == 0) {
      ASSERT_EQ(m.selected(), ListModel::kNoSelection);
    } else {
      ASSERT_TRUE(m.selected() >= 0 && m.selected() <= n - 1);
    }
  }
}

TEST(list_model_selection_is_positional) {
  ListModel m;
  m.refresh(make_items(4));
  m.move_selection(2);
  auto shifted = make_items(4);
  shifted.erase(shifted.begin());
  m.refresh(shifted);
  ASSERT_EQ(m.selected(), 2);
  ASSERT_EQ(m.current_selection()->pid, 103);
}

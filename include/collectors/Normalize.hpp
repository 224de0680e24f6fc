#pragma once
#include "model/Listener.hpp"
#include <vector>

namespace pui::collectors {

// Order by port ascending, then TCP before UDP, then pid; collapse records
// with the same (port, protocol, pid) keeping the first address seen.
void normalize_entries(std::vector<pui::model::ListeningProcess>& entries);

} // namespace pui::collectors

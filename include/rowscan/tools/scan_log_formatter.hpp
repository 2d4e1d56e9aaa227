#pragma once

#include "rowscan/storage/scan_index_events.hpp"

#include <string>

namespace rowscan::tools {

[[nodiscard]] std::string format_scan_event_log_json(const rowscan::storage::ScanIndexEvent& event);

}  // namespace rowscan::tools

#pragma once

#include "rowscan/storage/row.hpp"
#include "rowscan/txn/session_types.hpp"

namespace rowscan::storage {

// Row found in an occupied slot: hidden while another session's insert is uncommitted.
[[nodiscard]] bool is_slot_row_visible(const Row& row, txn::SessionId reader_session) noexcept;

// Row found in the delta set: produced only when another session deleted it and the
// delete is not committed yet, so the reader still sees the row.
[[nodiscard]] bool is_delta_row_visible(const Row& row, txn::SessionId reader_session) noexcept;

}  // namespace rowscan::storage

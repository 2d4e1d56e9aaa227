#include "rowscan/storage/scan_visibility.hpp"

namespace rowscan::storage {
namespace {

[[nodiscard]] bool is_foreign_change(txn::SessionId owner, txn::SessionId reader) noexcept
{
    return owner != txn::kNoSession && owner != reader;
}

}  // namespace

bool is_slot_row_visible(const Row& row, txn::SessionId reader_session) noexcept
{
    if (row.deleted()) {
        return false;
    }
    return !is_foreign_change(row.owning_session(), reader_session);
}

bool is_delta_row_visible(const Row& row, txn::SessionId reader_session) noexcept
{
    if (!row.deleted()) {
        return false;
    }
    return is_foreign_change(row.owning_session(), reader_session);
}

}  // namespace rowscan::storage

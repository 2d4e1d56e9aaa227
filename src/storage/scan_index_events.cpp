#include "rowscan/storage/scan_index_events.hpp"

namespace rowscan::storage {

std::string_view to_string(ScanIndexEventKind kind) noexcept
{
    switch (kind) {
    case ScanIndexEventKind::Add:
        return "add";
    case ScanIndexEventKind::Remove:
        return "remove";
    case ScanIndexEventKind::StoreReset:
        return "store_reset";
    case ScanIndexEventKind::Commit:
        return "commit";
    case ScanIndexEventKind::CompleteCommit:
        return "complete_commit";
    case ScanIndexEventKind::RollbackInsert:
        return "rollback_insert";
    case ScanIndexEventKind::RollbackDelete:
        return "rollback_delete";
    case ScanIndexEventKind::Truncate:
        return "truncate";
    case ScanIndexEventKind::CursorOpened:
        return "cursor_opened";
    case ScanIndexEventKind::Failure:
    default:
        return "failure";
    }
}

}  // namespace rowscan::storage

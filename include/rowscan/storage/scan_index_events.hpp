#pragma once

#include "rowscan/storage/storage_ids.hpp"
#include "rowscan/txn/session_types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace rowscan::storage {

enum class ScanIndexEventKind : std::uint8_t {
    Add,
    Remove,
    StoreReset,
    Commit,
    CompleteCommit,
    RollbackInsert,
    RollbackDelete,
    Truncate,
    CursorOpened,
    Failure
};

struct ScanIndexEvent final {
    ScanIndexEventKind kind = ScanIndexEventKind::Add;
    std::string index_name{};
    txn::SessionId session = txn::kNoSession;
    std::optional<SlotIndex> slot{};
    RowToken token = kUnassignedRowToken;
    std::uint64_t row_count = 0U;
    std::size_t delta_size = 0U;
    std::error_code error{};
    std::string context{};
    std::chrono::system_clock::time_point timestamp{};
};

using ScanIndexEventLogger = std::function<void(const ScanIndexEvent&)>;

[[nodiscard]] std::string_view to_string(ScanIndexEventKind kind) noexcept;

}  // namespace rowscan::storage

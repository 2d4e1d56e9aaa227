#pragma once

#include "rowscan/storage/row.hpp"
#include "rowscan/storage/storage_ids.hpp"
#include "rowscan/txn/session_types.hpp"

#include <cstddef>
#include <cstdint>
#include <ranges>
#include <system_error>
#include <unordered_map>

namespace rowscan::txn {

enum class DeltaToggle : std::uint8_t {
    Inserted,
    Cancelled
};

// Per-table bookkeeping for multi-version mode. The delta set holds the rows with an
// uncommitted insert or delete; the adjustment map holds each session's signed row count
// relative to the committed baseline, and the drift is the sum of all adjustments.
//
// visible_row_count(S) = committed + adjustment(S) - drift
//
// Rows in the delta set are owned by the slot store; the tracker only points at them.
class MultiVersionTracker final {
public:
    MultiVersionTracker() = default;

    MultiVersionTracker(const MultiVersionTracker&) = delete;
    MultiVersionTracker& operator=(const MultiVersionTracker&) = delete;

    [[nodiscard]] std::error_code on_add(storage::Row& row, SessionId session);
    [[nodiscard]] std::error_code on_remove(storage::Row& row, SessionId session);
    [[nodiscard]] std::error_code on_commit(const storage::Row& row,
                                            UndoOperation operation,
                                            SessionId originating_session);

    DeltaToggle toggle_delta(storage::Row& row);

    [[nodiscard]] std::error_code validate_adjust(SessionId session, std::int64_t delta) const noexcept;
    [[nodiscard]] std::error_code adjust(SessionId session, std::int64_t delta);

    [[nodiscard]] std::error_code visible_row_count(SessionId session,
                                                    std::uint64_t committed_count,
                                                    std::uint64_t& out_count) const noexcept;

    void truncate() noexcept;

    [[nodiscard]] bool contains(storage::RowToken token) const noexcept;
    [[nodiscard]] storage::Row* find(storage::RowToken token) const noexcept;
    [[nodiscard]] std::size_t delta_size() const noexcept;
    [[nodiscard]] std::int64_t adjustment(SessionId session) const noexcept;
    [[nodiscard]] std::int64_t total_drift() const noexcept;
    [[nodiscard]] std::size_t session_count() const noexcept;

    // Lazy view over the current delta members; every call observes the current state.
    [[nodiscard]] auto delta() const
    {
        return delta_ | std::views::values;
    }

private:
    std::unordered_map<storage::RowToken, storage::Row*> delta_{};
    std::unordered_map<SessionId, std::int64_t> adjustments_{};
    std::int64_t total_drift_ = 0;
};

}  // namespace rowscan::txn

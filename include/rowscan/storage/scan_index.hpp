#pragma once

#include "rowscan/storage/row.hpp"
#include "rowscan/storage/scan_collaborators.hpp"
#include "rowscan/storage/scan_index_events.hpp"
#include "rowscan/storage/scan_index_telemetry.hpp"
#include "rowscan/storage/slot_store.hpp"
#include "rowscan/storage/storage_ids.hpp"
#include "rowscan/storage/table_index.hpp"
#include "rowscan/txn/multi_version_tracker.hpp"
#include "rowscan/txn/session_types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace rowscan::storage {

// Added to the row count so the planner prefers any usable index over a full scan.
inline constexpr double kDefaultRowCostOffset = 1000.0;

class ScanIndex;

// Walks the slots of a ScanIndex in ascending order. In multi-version mode the rows other
// sessions deleted without committing are produced first, then the occupied slots minus
// other sessions' uncommitted inserts. The cursor keeps positions only, so it may be
// dropped at any point; it must not outlive its index.
class ScanCursor final : public IndexCursor {
public:
    enum class State : std::uint8_t {
        NotStarted,
        Positioned,
        Exhausted
    };

    // Only a ScanIndex can construct the key, so cursors come from open_cursor().
    class Key final {
        friend class ScanIndex;
        Key() = default;
    };

    ScanCursor(Key key, ScanIndex* index, txn::SessionId session, std::vector<RowToken> delta_tokens);

    bool next(Row& out_row) override;

    [[nodiscard]] State state() const noexcept;
    [[nodiscard]] std::optional<SlotIndex> position() const noexcept;
    [[nodiscard]] txn::SessionId session() const noexcept;

private:
    friend class ScanIndex;

    ScanIndex* index_ = nullptr;
    txn::SessionId session_ = txn::kNoSession;
    std::vector<RowToken> delta_tokens_{};
    std::size_t delta_position_ = 0U;
    std::optional<SlotIndex> position_{};
    State state_ = State::NotStarted;
};

// The scan index is not an index in the strict sense: it cannot be used for lookups and
// only iterates over all rows of a table. Every table has one, even without a primary key.
class ScanIndex final : public TableIndex {
public:
    struct Config final {
        ScanDatabase* database = nullptr;
        ScanTable* table = nullptr;
        IndexId index_id{};
        double row_cost_offset = kDefaultRowCostOffset;
        ScanIndexTelemetry* telemetry = nullptr;
        ScanIndexEventLogger event_logger{};
    };

    explicit ScanIndex(Config config);

    Row add(txn::SessionId session, Row row) override;
    std::optional<Row> remove(txn::SessionId session, const Row& row) override;
    void commit(txn::UndoOperation operation, const Row& row) override;
    void truncate(txn::SessionId session) override;
    void remove_index(txn::SessionId session) override;
    void close(txn::SessionId session) override;

    // Clears the row's owning session once every undo record of its transaction committed;
    // releases rows whose delete committed.
    void complete_commit(const Row& row);

    // Undo of an insert discards the row; undo of a delete restores the row retained since
    // the remove and returns it, possibly in a different slot. Single-version indexes hand
    // removed rows back to the caller instead, so there they are re-added with add().
    std::optional<Row> rollback(txn::SessionId session, txn::UndoOperation operation, const Row& row);

    [[nodiscard]] Row get_row(txn::SessionId session, SlotIndex key) const override;
    [[nodiscard]] std::unique_ptr<IndexCursor> find(txn::SessionId session) override;
    [[nodiscard]] std::unique_ptr<ScanCursor> open_cursor(txn::SessionId session);
    [[nodiscard]] std::unique_ptr<IndexCursor> find_first_or_last(txn::SessionId session, bool first) override;
    [[nodiscard]] bool can_get_first_or_last() const noexcept override;
    void check_rename() const override;

    [[nodiscard]] double cost() const override;
    [[nodiscard]] std::uint64_t row_count(txn::SessionId session) const override;
    [[nodiscard]] std::uint64_t row_count_approximation() const override;
    [[nodiscard]] std::uint64_t disk_space_used() const noexcept override;
    [[nodiscard]] bool needs_rebuild() const noexcept override;
    [[nodiscard]] int column_index(std::uint32_t column_id) const noexcept override;

    [[nodiscard]] const std::string& name() const noexcept override;
    [[nodiscard]] std::string plan_sql() const override;
    [[nodiscard]] std::string create_sql() const override;

    [[nodiscard]] IndexId id() const noexcept;
    [[nodiscard]] bool is_multi_version() const noexcept;
    [[nodiscard]] std::size_t delta_size() const;
    [[nodiscard]] std::size_t slot_count() const;
    [[nodiscard]] std::size_t retired_count() const;
    [[nodiscard]] std::vector<SlotIndex> free_list() const;

private:
    friend class ScanCursor;

    [[nodiscard]] std::error_code add_locked(txn::SessionId session,
                                             std::unique_ptr<Row> row,
                                             Row*& out_row,
                                             ScanIndexEvent& event);
    [[nodiscard]] std::error_code remove_locked(txn::SessionId session,
                                                const Row& handle,
                                                std::unique_ptr<Row>& out_detached,
                                                ScanIndexEvent& event);
    [[nodiscard]] std::error_code commit_locked(txn::UndoOperation operation,
                                                const Row& handle,
                                                ScanIndexEvent& event);
    [[nodiscard]] std::error_code complete_commit_locked(const Row& handle, ScanIndexEvent& event);
    [[nodiscard]] std::error_code rollback_locked(txn::SessionId session,
                                                  txn::UndoOperation operation,
                                                  const Row& handle,
                                                  Row*& out_restored,
                                                  ScanIndexEvent& event);
    void truncate_locked();

    [[nodiscard]] std::error_code resolve_stored_locked(const Row& handle, Row*& out_row) noexcept;
    [[nodiscard]] Row* resolve_any_locked(const Row& handle) noexcept;

    bool advance_cursor(ScanCursor& cursor, Row& out_row);

    void stamp_locked(ScanIndexEvent& event) const;
    void publish(ScanIndexEvent& event, std::error_code ec, const char* context) const;

    Config config_{};
    std::string name_{};
    bool multi_version_ = false;
    mutable std::mutex mutex_{};
    SlotStore store_;
    std::optional<txn::MultiVersionTracker> tracker_{};
};

}  // namespace rowscan::storage

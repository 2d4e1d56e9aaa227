#pragma once

#include "rowscan/storage/row.hpp"
#include "rowscan/storage/storage_ids.hpp"
#include "rowscan/txn/session_types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace rowscan::storage {

class IndexCursor {
public:
    virtual ~IndexCursor() = default;

    // Copies the next row into out_row; false once the cursor is exhausted.
    virtual bool next(Row& out_row) = 0;
};

// Structure a table keeps its rows in. Rows passed back in are handles: the index resolves
// them by slot and token to the row it owns.
class TableIndex {
public:
    virtual ~TableIndex() = default;

    TableIndex(const TableIndex&) = delete;
    TableIndex& operator=(const TableIndex&) = delete;

    virtual Row add(txn::SessionId session, Row row) = 0;
    virtual std::optional<Row> remove(txn::SessionId session, const Row& row) = 0;
    virtual void commit(txn::UndoOperation operation, const Row& row) = 0;
    virtual void truncate(txn::SessionId session) = 0;
    virtual void remove_index(txn::SessionId session) = 0;
    virtual void close(txn::SessionId session) = 0;

    [[nodiscard]] virtual Row get_row(txn::SessionId session, SlotIndex key) const = 0;
    [[nodiscard]] virtual std::unique_ptr<IndexCursor> find(txn::SessionId session) = 0;
    [[nodiscard]] virtual std::unique_ptr<IndexCursor> find_first_or_last(txn::SessionId session, bool first) = 0;
    [[nodiscard]] virtual bool can_get_first_or_last() const noexcept = 0;
    virtual void check_rename() const = 0;

    [[nodiscard]] virtual double cost() const = 0;
    [[nodiscard]] virtual std::uint64_t row_count(txn::SessionId session) const = 0;
    [[nodiscard]] virtual std::uint64_t row_count_approximation() const = 0;
    [[nodiscard]] virtual std::uint64_t disk_space_used() const noexcept = 0;
    [[nodiscard]] virtual bool needs_rebuild() const noexcept = 0;
    [[nodiscard]] virtual int column_index(std::uint32_t column_id) const noexcept = 0;

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;
    [[nodiscard]] virtual std::string plan_sql() const = 0;
    [[nodiscard]] virtual std::string create_sql() const = 0;

protected:
    TableIndex() = default;
};

}  // namespace rowscan::storage

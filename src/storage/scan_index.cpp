#include "rowscan/storage/scan_index.hpp"

#include "rowscan/storage/scan_errors.hpp"
#include "rowscan/storage/scan_visibility.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace rowscan::storage {

namespace {

ScanIndex::Config validate_config(ScanIndex::Config config)
{
    if (config.database == nullptr) {
        throw std::invalid_argument{"ScanIndex requires a database"};
    }
    if (config.table == nullptr) {
        throw std::invalid_argument{"ScanIndex requires a table"};
    }
    return config;
}

[[noreturn]] void throw_unsupported()
{
    throw std::system_error(make_error_code(ScanErrc::UnsupportedOperation), "SCAN");
}

}  // namespace

ScanCursor::ScanCursor(Key, ScanIndex* index, txn::SessionId session, std::vector<RowToken> delta_tokens)
    : index_{index}
    , session_{session}
    , delta_tokens_{std::move(delta_tokens)}
{
}

bool ScanCursor::next(Row& out_row)
{
    if (state_ == State::Exhausted || index_ == nullptr) {
        return false;
    }
    return index_->advance_cursor(*this, out_row);
}

ScanCursor::State ScanCursor::state() const noexcept
{
    return state_;
}

std::optional<SlotIndex> ScanCursor::position() const noexcept
{
    return position_;
}

txn::SessionId ScanCursor::session() const noexcept
{
    return session_;
}

ScanIndex::ScanIndex(Config config)
    : config_{validate_config(std::move(config))}
    , name_{config_.table->name() + "_DATA"}
    , multi_version_{config_.database->is_multi_version_mode()}
    , store_{SlotStore::Config{multi_version_}}
{
    if (multi_version_) {
        tracker_.emplace();
    }
}

Row ScanIndex::add(txn::SessionId session, Row row)
{
    ScanIndexTelemetry::LatencyScope latency{config_.telemetry, ScanIndexTelemetry::Operation::Add};
    ScanIndexEvent event{};
    event.kind = ScanIndexEventKind::Add;
    event.session = session;

    Row stored_copy;
    std::error_code ec;
    {
        std::scoped_lock lock{mutex_};
        // A copy of a stored or retired row would share its token and its delta entry.
        if (row.slot() || store_.holds(row.token())) {
            ec = make_error_code(ScanErrc::InvalidArgument);
        } else {
            Row* stored = nullptr;
            ec = add_locked(session, std::make_unique<Row>(std::move(row)), stored, event);
            if (!ec) {
                stored_copy = *stored;
            }
        }
        stamp_locked(event);
    }
    publish(event, ec, "ScanIndex::add");
    return stored_copy;
}

std::optional<Row> ScanIndex::remove(txn::SessionId session, const Row& row)
{
    ScanIndexTelemetry::LatencyScope latency{config_.telemetry, ScanIndexTelemetry::Operation::Remove};
    ScanIndexEvent event{};
    event.kind = ScanIndexEventKind::Remove;
    event.session = session;

    std::unique_ptr<Row> detached;
    std::error_code ec;
    {
        std::scoped_lock lock{mutex_};
        ec = remove_locked(session, row, detached, event);
        stamp_locked(event);
    }
    publish(event, ec, "ScanIndex::remove");

    if (!detached) {
        return std::nullopt;
    }
    return std::optional<Row>{std::move(*detached)};
}

void ScanIndex::commit(txn::UndoOperation operation, const Row& row)
{
    ScanIndexTelemetry::LatencyScope latency{config_.telemetry, ScanIndexTelemetry::Operation::Commit};
    ScanIndexEvent event{};
    event.kind = ScanIndexEventKind::Commit;

    std::error_code ec;
    {
        std::scoped_lock lock{mutex_};
        ec = commit_locked(operation, row, event);
        stamp_locked(event);
    }
    publish(event, ec, "ScanIndex::commit");
}

void ScanIndex::complete_commit(const Row& row)
{
    ScanIndexTelemetry::LatencyScope latency{config_.telemetry, ScanIndexTelemetry::Operation::Commit};
    ScanIndexEvent event{};
    event.kind = ScanIndexEventKind::CompleteCommit;

    std::error_code ec;
    {
        std::scoped_lock lock{mutex_};
        ec = complete_commit_locked(row, event);
        stamp_locked(event);
    }
    publish(event, ec, "ScanIndex::complete_commit");
}

std::optional<Row> ScanIndex::rollback(txn::SessionId session, txn::UndoOperation operation, const Row& row)
{
    ScanIndexTelemetry::LatencyScope latency{config_.telemetry, ScanIndexTelemetry::Operation::Rollback};
    ScanIndexEvent event{};
    event.kind = operation == txn::UndoOperation::Insert ? ScanIndexEventKind::RollbackInsert
                                                         : ScanIndexEventKind::RollbackDelete;
    event.session = session;

    std::optional<Row> restored;
    std::error_code ec;
    {
        std::scoped_lock lock{mutex_};
        Row* restored_row = nullptr;
        ec = rollback_locked(session, operation, row, restored_row, event);
        if (!ec && restored_row != nullptr) {
            restored = *restored_row;
        }
        stamp_locked(event);
    }
    publish(event, ec, "ScanIndex::rollback");
    return restored;
}

void ScanIndex::truncate(txn::SessionId session)
{
    ScanIndexTelemetry::LatencyScope latency{config_.telemetry, ScanIndexTelemetry::Operation::Truncate};
    ScanIndexEvent event{};
    event.kind = ScanIndexEventKind::Truncate;
    event.session = session;
    {
        std::scoped_lock lock{mutex_};
        truncate_locked();
        stamp_locked(event);
    }
    if (config_.telemetry != nullptr) {
        config_.telemetry->record_truncate();
    }
    publish(event, {}, "ScanIndex::truncate");
}

void ScanIndex::remove_index(txn::SessionId session)
{
    truncate(session);
}

void ScanIndex::close(txn::SessionId session)
{
    (void)session;
}

Row ScanIndex::get_row(txn::SessionId session, SlotIndex key) const
{
    (void)session;
    std::scoped_lock lock{mutex_};
    const auto* row = store_.get(key);
    if (row == nullptr) {
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_failure();
        }
        throw std::system_error(make_error_code(ScanErrc::SlotNotFound), "ScanIndex::get_row");
    }
    return *row;
}

std::unique_ptr<IndexCursor> ScanIndex::find(txn::SessionId session)
{
    return open_cursor(session);
}

std::unique_ptr<ScanCursor> ScanIndex::open_cursor(txn::SessionId session)
{
    ScanIndexEvent event{};
    event.kind = ScanIndexEventKind::CursorOpened;
    event.session = session;

    std::vector<RowToken> delta_tokens;
    {
        std::scoped_lock lock{mutex_};
        if (tracker_) {
            delta_tokens.reserve(tracker_->delta_size());
            for (const auto* row : tracker_->delta()) {
                delta_tokens.push_back(row->token());
            }
        }
        stamp_locked(event);
    }
    if (config_.telemetry != nullptr) {
        config_.telemetry->record_cursor_open();
    }
    publish(event, {}, "ScanIndex::open_cursor");

    return std::make_unique<ScanCursor>(ScanCursor::Key{}, this, session, std::move(delta_tokens));
}

std::unique_ptr<IndexCursor> ScanIndex::find_first_or_last(txn::SessionId session, bool first)
{
    (void)session;
    (void)first;
    throw_unsupported();
}

bool ScanIndex::can_get_first_or_last() const noexcept
{
    return false;
}

void ScanIndex::check_rename() const
{
    throw_unsupported();
}

double ScanIndex::cost() const
{
    return static_cast<double>(config_.table->row_count_approximation()) + config_.row_cost_offset;
}

std::uint64_t ScanIndex::row_count(txn::SessionId session) const
{
    std::scoped_lock lock{mutex_};
    if (!tracker_) {
        return store_.row_count();
    }

    std::uint64_t count = 0U;
    if (auto ec = tracker_->visible_row_count(session, store_.row_count(), count); ec) {
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_failure();
        }
        throw std::system_error(ec, "ScanIndex::row_count");
    }
    return count;
}

std::uint64_t ScanIndex::row_count_approximation() const
{
    std::scoped_lock lock{mutex_};
    return store_.row_count();
}

std::uint64_t ScanIndex::disk_space_used() const noexcept
{
    return 0U;
}

bool ScanIndex::needs_rebuild() const noexcept
{
    return false;
}

int ScanIndex::column_index(std::uint32_t column_id) const noexcept
{
    // The scan index cannot use any columns.
    (void)column_id;
    return -1;
}

const std::string& ScanIndex::name() const noexcept
{
    return name_;
}

std::string ScanIndex::plan_sql() const
{
    return config_.table->name() + ".tableScan";
}

std::string ScanIndex::create_sql() const
{
    return {};
}

IndexId ScanIndex::id() const noexcept
{
    return config_.index_id;
}

bool ScanIndex::is_multi_version() const noexcept
{
    return multi_version_;
}

std::size_t ScanIndex::delta_size() const
{
    std::scoped_lock lock{mutex_};
    return tracker_ ? tracker_->delta_size() : 0U;
}

std::size_t ScanIndex::slot_count() const
{
    std::scoped_lock lock{mutex_};
    return store_.size();
}

std::size_t ScanIndex::retired_count() const
{
    std::scoped_lock lock{mutex_};
    return store_.retired_count();
}

std::vector<SlotIndex> ScanIndex::free_list() const
{
    std::scoped_lock lock{mutex_};
    return store_.free_list();
}

std::error_code ScanIndex::add_locked(txn::SessionId session,
                                      std::unique_ptr<Row> row,
                                      Row*& out_row,
                                      ScanIndexEvent& event)
{
    if (tracker_) {
        if (session == txn::kNoSession) {
            return make_error_code(ScanErrc::InvalidArgument);
        }
        if (auto ec = tracker_->validate_adjust(session, 1); ec) {
            return ec;
        }
    }

    const bool reuses_slot = store_.free_list_head().has_value();
    auto& stored = store_.add(std::move(row));
    if (tracker_) {
        stored.set_owning_session(session);
        if (auto ec = tracker_->on_add(stored, session); ec) {
            return ec;
        }
    }

    if (config_.telemetry != nullptr) {
        config_.telemetry->record_add(reuses_slot);
    }
    event.slot = stored.slot();
    event.token = stored.token();
    out_row = &stored;
    return {};
}

std::error_code ScanIndex::remove_locked(txn::SessionId session,
                                         const Row& handle,
                                         std::unique_ptr<Row>& out_detached,
                                         ScanIndexEvent& event)
{
    Row* stored = nullptr;
    if (auto ec = resolve_stored_locked(handle, stored); ec) {
        return ec;
    }

    if (tracker_) {
        if (session == txn::kNoSession) {
            return make_error_code(ScanErrc::InvalidArgument);
        }
        const auto owner = stored->owning_session();
        if (owner != txn::kNoSession && owner != session) {
            return make_error_code(ScanErrc::ConcurrentUpdate);
        }
        if (auto ec = tracker_->validate_adjust(session, -1); ec) {
            return ec;
        }
    }

    const auto slot = *stored->slot();
    event.slot = slot;
    event.token = stored->token();

    std::unique_ptr<Row> detached;
    if (auto ec = store_.remove(slot, detached); ec) {
        return ec;
    }

    const bool store_reset = !tracker_ && store_.size() == 0U;
    if (store_reset) {
        event.kind = ScanIndexEventKind::StoreReset;
    }

    if (tracker_) {
        detached->set_owning_session(session);
        auto& retired = store_.retire(std::move(detached));
        if (auto ec = tracker_->on_remove(retired, session); ec) {
            return ec;
        }
    } else {
        out_detached = std::move(detached);
    }

    if (config_.telemetry != nullptr) {
        config_.telemetry->record_remove(store_reset, tracker_.has_value());
    }
    return {};
}

std::error_code ScanIndex::commit_locked(txn::UndoOperation operation, const Row& handle, ScanIndexEvent& event)
{
    event.token = handle.token();
    if (!tracker_) {
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_commit();
        }
        return {};
    }

    auto* row = resolve_any_locked(handle);
    if (row == nullptr) {
        return make_error_code(ScanErrc::SlotNotFound);
    }

    event.session = row->owning_session();
    event.slot = row->slot();
    if (row->owning_session() == txn::kNoSession) {
        // Committed already; a second commit would shift every session's count.
        return make_error_code(ScanErrc::InvalidArgument);
    }
    if (auto ec = tracker_->on_commit(*row, operation, row->owning_session()); ec) {
        return ec;
    }

    if (config_.telemetry != nullptr) {
        config_.telemetry->record_commit();
    }
    return {};
}

std::error_code ScanIndex::complete_commit_locked(const Row& handle, ScanIndexEvent& event)
{
    event.token = handle.token();
    auto* row = resolve_any_locked(handle);
    if (row == nullptr) {
        // Already released by an earlier record of the same transaction, or removed from a
        // single-version index.
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_completed_commit();
        }
        return {};
    }

    event.session = row->owning_session();
    event.slot = row->slot();
    if (row->slot()) {
        row->set_owning_session(txn::kNoSession);
    } else if (!tracker_ || !tracker_->contains(row->token())) {
        // The delete committed; nothing can observe the row any more.
        store_.release_retired(row->token());
    }

    if (config_.telemetry != nullptr) {
        config_.telemetry->record_completed_commit();
    }
    return {};
}

std::error_code ScanIndex::rollback_locked(txn::SessionId session,
                                           txn::UndoOperation operation,
                                           const Row& handle,
                                           Row*& out_restored,
                                           ScanIndexEvent& event)
{
    if (operation == txn::UndoOperation::Insert) {
        if (tracker_) {
            Row* stored = nullptr;
            if (auto ec = resolve_stored_locked(handle, stored); ec) {
                return ec;
            }
            if (stored->owning_session() != session) {
                return make_error_code(ScanErrc::ConcurrentUpdate);
            }
        }
        std::unique_ptr<Row> detached;
        if (auto ec = remove_locked(session, handle, detached, event); ec) {
            return ec;
        }
        event.kind = ScanIndexEventKind::RollbackInsert;
        if (tracker_ && !tracker_->contains(handle.token())) {
            store_.release_retired(handle.token());
        }
    } else {
        const auto* retired = tracker_ ? store_.find_retired(handle.token()) : nullptr;
        if (retired == nullptr) {
            return make_error_code(ScanErrc::RowNotRetired);
        }
        if (session == txn::kNoSession) {
            return make_error_code(ScanErrc::InvalidArgument);
        }
        if (retired->owning_session() != session) {
            return make_error_code(ScanErrc::ConcurrentUpdate);
        }
        if (auto ec = tracker_->validate_adjust(session, 1); ec) {
            return ec;
        }

        Row* restored = nullptr;
        if (auto ec = add_locked(session, store_.restore(handle.token()), restored, event); ec) {
            return ec;
        }
        // Restoring a committed row cancels its pending delete; the row is committed again.
        if (!tracker_->contains(restored->token())) {
            restored->set_owning_session(txn::kNoSession);
        }
        out_restored = restored;
    }

    if (config_.telemetry != nullptr) {
        config_.telemetry->record_rollback();
    }
    return {};
}

void ScanIndex::truncate_locked()
{
    if (tracker_) {
        tracker_->truncate();
    }
    store_.truncate();

    auto& table = *config_.table;
    table.set_row_count(0U);
    if (table.contains_large_object() && table.persists_data()) {
        if (auto* large_objects = config_.database->large_object_store(); large_objects != nullptr) {
            large_objects->remove_all_for_table(table.id());
        }
    }
}

std::error_code ScanIndex::resolve_stored_locked(const Row& handle, Row*& out_row) noexcept
{
    const auto slot = handle.slot();
    if (!slot || slot->value >= store_.size()) {
        return make_error_code(ScanErrc::SlotNotFound);
    }
    auto* row = store_.get(*slot);
    if (row == nullptr) {
        return make_error_code(ScanErrc::SlotNotOccupied);
    }
    if (row->token() != handle.token()) {
        return make_error_code(ScanErrc::SlotNotFound);
    }
    out_row = row;
    return {};
}

Row* ScanIndex::resolve_any_locked(const Row& handle) noexcept
{
    Row* row = nullptr;
    if (!resolve_stored_locked(handle, row)) {
        return row;
    }
    return store_.find_retired(handle.token());
}

bool ScanIndex::advance_cursor(ScanCursor& cursor, Row& out_row)
{
    ScanIndexTelemetry::LatencyScope latency{config_.telemetry, ScanIndexTelemetry::Operation::Scan};
    std::scoped_lock lock{mutex_};

    while (cursor.delta_position_ < cursor.delta_tokens_.size()) {
        const auto token = cursor.delta_tokens_[cursor.delta_position_++];
        const auto* row = tracker_ ? tracker_->find(token) : nullptr;
        if (row == nullptr) {
            continue;
        }
        const bool visible = is_delta_row_visible(*row, cursor.session_);
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_cursor_row(visible);
        }
        if (visible) {
            out_row = *row;
            cursor.state_ = ScanCursor::State::Positioned;
            return true;
        }
    }

    while (const auto* row = store_.next_occupied_after(cursor.position_)) {
        cursor.position_ = row->slot();
        const bool visible = !tracker_ || is_slot_row_visible(*row, cursor.session_);
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_cursor_row(visible);
        }
        if (visible) {
            out_row = *row;
            cursor.state_ = ScanCursor::State::Positioned;
            return true;
        }
    }

    cursor.state_ = ScanCursor::State::Exhausted;
    return false;
}

void ScanIndex::stamp_locked(ScanIndexEvent& event) const
{
    event.row_count = store_.row_count();
    event.delta_size = tracker_ ? tracker_->delta_size() : 0U;
}

void ScanIndex::publish(ScanIndexEvent& event, std::error_code ec, const char* context) const
{
    if (ec && config_.telemetry != nullptr) {
        config_.telemetry->record_failure();
    }

    if (config_.event_logger) {
        event.index_name = name_;
        event.timestamp = std::chrono::system_clock::now();
        if (ec) {
            event.kind = ScanIndexEventKind::Failure;
            event.error = ec;
            event.context = context;
        }
        config_.event_logger(event);
    }

    if (ec) {
        throw std::system_error(ec, context);
    }
}

}  // namespace rowscan::storage

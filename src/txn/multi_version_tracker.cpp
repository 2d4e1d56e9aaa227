#include "rowscan/txn/multi_version_tracker.hpp"

#include "rowscan/storage/scan_errors.hpp"

#include <limits>

namespace rowscan::txn {

namespace {

using storage::ScanErrc;

[[nodiscard]] bool checked_add(std::int64_t lhs, std::int64_t rhs, std::int64_t& out) noexcept
{
    if (rhs > 0 && lhs > std::numeric_limits<std::int64_t>::max() - rhs) {
        return false;
    }
    if (rhs < 0 && lhs < std::numeric_limits<std::int64_t>::min() - rhs) {
        return false;
    }
    out = lhs + rhs;
    return true;
}

}  // namespace

std::error_code MultiVersionTracker::on_add(storage::Row& row, SessionId session)
{
    if (auto ec = validate_adjust(session, 1); ec) {
        return ec;
    }
    (void)toggle_delta(row);
    return adjust(session, 1);
}

std::error_code MultiVersionTracker::on_remove(storage::Row& row, SessionId session)
{
    if (auto ec = validate_adjust(session, -1); ec) {
        return ec;
    }
    row.set_deleted(true);
    (void)toggle_delta(row);
    return adjust(session, -1);
}

std::error_code MultiVersionTracker::on_commit(const storage::Row& row,
                                               UndoOperation operation,
                                               SessionId originating_session)
{
    // The committed count already reflects the change; retire it from the drift.
    const std::int64_t delta = operation == UndoOperation::Delete ? 1 : -1;
    if (auto ec = validate_adjust(originating_session, delta); ec) {
        return ec;
    }
    delta_.erase(row.token());
    return adjust(originating_session, delta);
}

DeltaToggle MultiVersionTracker::toggle_delta(storage::Row& row)
{
    auto iter = delta_.find(row.token());
    if (iter != delta_.end()) {
        delta_.erase(iter);
        return DeltaToggle::Cancelled;
    }
    delta_.emplace(row.token(), &row);
    return DeltaToggle::Inserted;
}

std::error_code MultiVersionTracker::validate_adjust(SessionId session, std::int64_t delta) const noexcept
{
    std::int64_t ignored = 0;
    if (!checked_add(adjustment(session), delta, ignored) || !checked_add(total_drift_, delta, ignored)) {
        return make_error_code(ScanErrc::CountOverflow);
    }
    return {};
}

std::error_code MultiVersionTracker::adjust(SessionId session, std::int64_t delta)
{
    std::int64_t session_total = 0;
    std::int64_t drift = 0;
    if (!checked_add(adjustment(session), delta, session_total) || !checked_add(total_drift_, delta, drift)) {
        return make_error_code(ScanErrc::CountOverflow);
    }
    adjustments_[session] = session_total;
    total_drift_ = drift;
    return {};
}

std::error_code MultiVersionTracker::visible_row_count(SessionId session,
                                                       std::uint64_t committed_count,
                                                       std::uint64_t& out_count) const noexcept
{
    if (committed_count > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return make_error_code(ScanErrc::CountOverflow);
    }

    std::int64_t count = 0;
    if (!checked_add(static_cast<std::int64_t>(committed_count), adjustment(session), count)) {
        return make_error_code(ScanErrc::CountOverflow);
    }
    if (total_drift_ == std::numeric_limits<std::int64_t>::min() || !checked_add(count, -total_drift_, count)) {
        return make_error_code(ScanErrc::CountOverflow);
    }
    if (count < 0) {
        return make_error_code(ScanErrc::CountOverflow);
    }

    out_count = static_cast<std::uint64_t>(count);
    return {};
}

void MultiVersionTracker::truncate() noexcept
{
    delta_.clear();
    adjustments_.clear();
    total_drift_ = 0;
}

bool MultiVersionTracker::contains(storage::RowToken token) const noexcept
{
    return delta_.find(token) != delta_.end();
}

storage::Row* MultiVersionTracker::find(storage::RowToken token) const noexcept
{
    auto iter = delta_.find(token);
    return iter != delta_.end() ? iter->second : nullptr;
}

std::size_t MultiVersionTracker::delta_size() const noexcept
{
    return delta_.size();
}

std::int64_t MultiVersionTracker::adjustment(SessionId session) const noexcept
{
    auto iter = adjustments_.find(session);
    return iter != adjustments_.end() ? iter->second : 0;
}

std::int64_t MultiVersionTracker::total_drift() const noexcept
{
    return total_drift_;
}

std::size_t MultiVersionTracker::session_count() const noexcept
{
    return adjustments_.size();
}

}  // namespace rowscan::txn

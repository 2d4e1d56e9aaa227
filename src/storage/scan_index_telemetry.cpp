#include "rowscan/storage/scan_index_telemetry.hpp"

namespace rowscan::storage {

ScanIndexTelemetry::LatencyScope::LatencyScope(ScanIndexTelemetry* telemetry, Operation op) noexcept
    : telemetry_{telemetry}
    , operation_{op}
{
    if (telemetry_ != nullptr) {
        start_ = std::chrono::steady_clock::now();
    }
}

ScanIndexTelemetry::LatencyScope::~LatencyScope()
{
    if (telemetry_ == nullptr) {
        return;
    }
    const auto end = std::chrono::steady_clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_);
    const auto duration_ns = elapsed.count() > 0 ? static_cast<std::uint64_t>(elapsed.count()) : 0ULL;
    telemetry_->record_latency(operation_, duration_ns);
}

void ScanIndexTelemetry::record_add(bool reused_slot) noexcept
{
    rows_added_.fetch_add(1U, std::memory_order_relaxed);
    if (reused_slot) {
        slots_reused_.fetch_add(1U, std::memory_order_relaxed);
    }
}

void ScanIndexTelemetry::record_remove(bool store_reset, bool retired) noexcept
{
    rows_removed_.fetch_add(1U, std::memory_order_relaxed);
    if (store_reset) {
        store_resets_.fetch_add(1U, std::memory_order_relaxed);
    }
    if (retired) {
        rows_retired_.fetch_add(1U, std::memory_order_relaxed);
    }
}

void ScanIndexTelemetry::record_commit() noexcept
{
    commits_.fetch_add(1U, std::memory_order_relaxed);
}

void ScanIndexTelemetry::record_completed_commit() noexcept
{
    completed_commits_.fetch_add(1U, std::memory_order_relaxed);
}

void ScanIndexTelemetry::record_rollback() noexcept
{
    rollbacks_.fetch_add(1U, std::memory_order_relaxed);
}

void ScanIndexTelemetry::record_truncate() noexcept
{
    truncates_.fetch_add(1U, std::memory_order_relaxed);
}

void ScanIndexTelemetry::record_cursor_open() noexcept
{
    cursors_opened_.fetch_add(1U, std::memory_order_relaxed);
}

void ScanIndexTelemetry::record_cursor_row(bool visible) noexcept
{
    cursor_rows_read_.fetch_add(1U, std::memory_order_relaxed);
    if (visible) {
        cursor_rows_visible_.fetch_add(1U, std::memory_order_relaxed);
    }
}

void ScanIndexTelemetry::record_failure() noexcept
{
    failures_.fetch_add(1U, std::memory_order_relaxed);
}

void ScanIndexTelemetry::record_latency(Operation op, std::uint64_t duration_ns) noexcept
{
    const auto index = static_cast<std::size_t>(op);
    if (index >= latencies_.size()) {
        return;
    }
    auto& counters = latencies_[index];
    counters.invocations.fetch_add(1U, std::memory_order_relaxed);
    counters.total_duration_ns.fetch_add(duration_ns, std::memory_order_relaxed);
    counters.last_duration_ns.store(duration_ns, std::memory_order_relaxed);
}

ScanIndexTelemetrySnapshot ScanIndexTelemetry::snapshot() const noexcept
{
    ScanIndexTelemetrySnapshot snapshot{};
    snapshot.rows_added = rows_added_.load(std::memory_order_relaxed);
    snapshot.slots_reused = slots_reused_.load(std::memory_order_relaxed);
    snapshot.rows_removed = rows_removed_.load(std::memory_order_relaxed);
    snapshot.store_resets = store_resets_.load(std::memory_order_relaxed);
    snapshot.rows_retired = rows_retired_.load(std::memory_order_relaxed);
    snapshot.commits = commits_.load(std::memory_order_relaxed);
    snapshot.completed_commits = completed_commits_.load(std::memory_order_relaxed);
    snapshot.rollbacks = rollbacks_.load(std::memory_order_relaxed);
    snapshot.truncates = truncates_.load(std::memory_order_relaxed);
    snapshot.cursors_opened = cursors_opened_.load(std::memory_order_relaxed);
    snapshot.cursor_rows_read = cursor_rows_read_.load(std::memory_order_relaxed);
    snapshot.cursor_rows_visible = cursor_rows_visible_.load(std::memory_order_relaxed);
    snapshot.failures = failures_.load(std::memory_order_relaxed);

    auto load = [this](Operation op, ScanIndexTelemetrySnapshot::OperationLatencySnapshot& out) {
        const auto& counters = latencies_[static_cast<std::size_t>(op)];
        out.invocations = counters.invocations.load(std::memory_order_relaxed);
        out.total_duration_ns = counters.total_duration_ns.load(std::memory_order_relaxed);
        out.last_duration_ns = counters.last_duration_ns.load(std::memory_order_relaxed);
    };
    load(Operation::Add, snapshot.add_latency);
    load(Operation::Remove, snapshot.remove_latency);
    load(Operation::Commit, snapshot.commit_latency);
    load(Operation::Rollback, snapshot.rollback_latency);
    load(Operation::Truncate, snapshot.truncate_latency);
    load(Operation::Scan, snapshot.scan_latency);
    return snapshot;
}

void ScanIndexTelemetry::reset() noexcept
{
    rows_added_.store(0U, std::memory_order_relaxed);
    slots_reused_.store(0U, std::memory_order_relaxed);
    rows_removed_.store(0U, std::memory_order_relaxed);
    store_resets_.store(0U, std::memory_order_relaxed);
    rows_retired_.store(0U, std::memory_order_relaxed);
    commits_.store(0U, std::memory_order_relaxed);
    completed_commits_.store(0U, std::memory_order_relaxed);
    rollbacks_.store(0U, std::memory_order_relaxed);
    truncates_.store(0U, std::memory_order_relaxed);
    cursors_opened_.store(0U, std::memory_order_relaxed);
    cursor_rows_read_.store(0U, std::memory_order_relaxed);
    cursor_rows_visible_.store(0U, std::memory_order_relaxed);
    failures_.store(0U, std::memory_order_relaxed);

    for (auto& counters : latencies_) {
        counters.invocations.store(0U, std::memory_order_relaxed);
        counters.total_duration_ns.store(0U, std::memory_order_relaxed);
        counters.last_duration_ns.store(0U, std::memory_order_relaxed);
    }
}

}  // namespace rowscan::storage

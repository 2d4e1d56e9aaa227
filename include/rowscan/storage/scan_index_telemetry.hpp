#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace rowscan::storage {

struct ScanIndexTelemetrySnapshot final {
    struct OperationLatencySnapshot final {
        std::uint64_t invocations = 0U;
        std::uint64_t total_duration_ns = 0U;
        std::uint64_t last_duration_ns = 0U;
    };

    std::uint64_t rows_added = 0U;
    std::uint64_t slots_reused = 0U;
    std::uint64_t rows_removed = 0U;
    std::uint64_t store_resets = 0U;
    std::uint64_t rows_retired = 0U;
    std::uint64_t commits = 0U;
    std::uint64_t completed_commits = 0U;
    std::uint64_t rollbacks = 0U;
    std::uint64_t truncates = 0U;
    std::uint64_t cursors_opened = 0U;
    std::uint64_t cursor_rows_read = 0U;
    std::uint64_t cursor_rows_visible = 0U;
    std::uint64_t failures = 0U;

    OperationLatencySnapshot add_latency{};
    OperationLatencySnapshot remove_latency{};
    OperationLatencySnapshot commit_latency{};
    OperationLatencySnapshot rollback_latency{};
    OperationLatencySnapshot truncate_latency{};
    OperationLatencySnapshot scan_latency{};
};

class ScanIndexTelemetry final {
public:
    enum class Operation {
        Add = 0,
        Remove,
        Commit,
        Rollback,
        Truncate,
        Scan,
        Count
    };

    class LatencyScope final {
    public:
        LatencyScope(ScanIndexTelemetry* telemetry, Operation op) noexcept;
        ~LatencyScope();

        LatencyScope(const LatencyScope&) = delete;
        LatencyScope& operator=(const LatencyScope&) = delete;

    private:
        ScanIndexTelemetry* telemetry_ = nullptr;
        Operation operation_ = Operation::Add;
        std::chrono::steady_clock::time_point start_{};
    };

    void record_add(bool reused_slot) noexcept;
    void record_remove(bool store_reset, bool retired) noexcept;
    void record_commit() noexcept;
    void record_completed_commit() noexcept;
    void record_rollback() noexcept;
    void record_truncate() noexcept;
    void record_cursor_open() noexcept;
    void record_cursor_row(bool visible) noexcept;
    void record_failure() noexcept;

    void record_latency(Operation op, std::uint64_t duration_ns) noexcept;

    [[nodiscard]] ScanIndexTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    struct OperationLatencyCounters final {
        std::atomic<std::uint64_t> invocations{0U};
        std::atomic<std::uint64_t> total_duration_ns{0U};
        std::atomic<std::uint64_t> last_duration_ns{0U};
    };

    std::atomic<std::uint64_t> rows_added_{0U};
    std::atomic<std::uint64_t> slots_reused_{0U};
    std::atomic<std::uint64_t> rows_removed_{0U};
    std::atomic<std::uint64_t> store_resets_{0U};
    std::atomic<std::uint64_t> rows_retired_{0U};
    std::atomic<std::uint64_t> commits_{0U};
    std::atomic<std::uint64_t> completed_commits_{0U};
    std::atomic<std::uint64_t> rollbacks_{0U};
    std::atomic<std::uint64_t> truncates_{0U};
    std::atomic<std::uint64_t> cursors_opened_{0U};
    std::atomic<std::uint64_t> cursor_rows_read_{0U};
    std::atomic<std::uint64_t> cursor_rows_visible_{0U};
    std::atomic<std::uint64_t> failures_{0U};

    std::array<OperationLatencyCounters, static_cast<std::size_t>(Operation::Count)> latencies_{};
};

}  // namespace rowscan::storage

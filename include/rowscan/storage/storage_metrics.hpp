#pragma once

#include "rowscan/storage/storage_telemetry_registry.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace rowscan::storage {

struct StorageMetricsSnapshot final {
    std::uint64_t rows_added_total = 0U;
    std::uint64_t rows_removed_total = 0U;
    std::uint64_t slots_reused_total = 0U;
    std::uint64_t commits_total = 0U;
    std::uint64_t rollbacks_total = 0U;
    std::uint64_t failures_total = 0U;
    std::uint64_t scan_rows_read_total = 0U;
    std::uint64_t scan_rows_visible_total = 0U;
    double scan_visible_ratio = 0.0;
    std::uint64_t scan_latency_count = 0U;
    double scan_latency_total_seconds = 0.0;
    double scan_latency_last_seconds = 0.0;
};

StorageMetricsSnapshot collect_storage_metrics(const StorageTelemetryRegistry& registry);

std::string storage_metrics_to_openmetrics(const StorageMetricsSnapshot& snapshot,
                                           std::chrono::system_clock::time_point wall_now = std::chrono::system_clock::now());

}  // namespace rowscan::storage

#include "rowscan/storage/storage_metrics.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace rowscan::storage {
namespace {

constexpr double kNsPerSecond = 1'000'000'000.0;

[[nodiscard]] double to_seconds(std::uint64_t ns) noexcept
{
    return static_cast<double>(ns) / kNsPerSecond;
}

[[nodiscard]] std::string format_double(double value)
{
    if (!std::isfinite(value)) {
        return "0";
    }
    std::ostringstream stream;
    stream << std::setprecision(17) << value;
    return stream.str();
}

void write_counter(std::ostringstream& out, const char* name, const char* help, std::uint64_t value)
{
    out << "# HELP " << name << ' ' << help << '\n';
    out << "# TYPE " << name << " counter\n";
    out << name << ' ' << value << '\n';
}

}  // namespace

StorageMetricsSnapshot collect_storage_metrics(const StorageTelemetryRegistry& registry)
{
    StorageMetricsSnapshot snapshot{};

    const auto scans = registry.aggregate_scan_indexes();
    snapshot.rows_added_total = scans.rows_added;
    snapshot.rows_removed_total = scans.rows_removed;
    snapshot.slots_reused_total = scans.slots_reused;
    snapshot.commits_total = scans.commits;
    snapshot.rollbacks_total = scans.rollbacks;
    snapshot.failures_total = scans.failures;
    snapshot.scan_rows_read_total = scans.cursor_rows_read;
    snapshot.scan_rows_visible_total = scans.cursor_rows_visible;
    if (scans.cursor_rows_read != 0U) {
        snapshot.scan_visible_ratio = static_cast<double>(scans.cursor_rows_visible)
            / static_cast<double>(scans.cursor_rows_read);
    }
    snapshot.scan_latency_count = scans.scan_latency.invocations;
    snapshot.scan_latency_total_seconds = to_seconds(scans.scan_latency.total_duration_ns);
    snapshot.scan_latency_last_seconds = to_seconds(scans.scan_latency.last_duration_ns);

    return snapshot;
}

std::string storage_metrics_to_openmetrics(const StorageMetricsSnapshot& snapshot,
                                           std::chrono::system_clock::time_point wall_now)
{
    const auto wall_seconds = std::chrono::duration_cast<std::chrono::nanoseconds>(wall_now.time_since_epoch()).count()
        / kNsPerSecond;

    std::ostringstream out;
    write_counter(out, "rowscan_rows_added_total", "Rows placed into scan index slots.", snapshot.rows_added_total);
    write_counter(out, "rowscan_rows_removed_total", "Rows removed from scan index slots.", snapshot.rows_removed_total);
    write_counter(out, "rowscan_slots_reused_total", "Insertions served from the free list.", snapshot.slots_reused_total);
    write_counter(out, "rowscan_commits_total", "Commit signals applied to scan indexes.", snapshot.commits_total);
    write_counter(out, "rowscan_rollbacks_total", "Rollback signals applied to scan indexes.", snapshot.rollbacks_total);
    write_counter(out, "rowscan_failures_total", "Scan index operations that reported an error.", snapshot.failures_total);
    write_counter(out, "rowscan_scan_rows_read_total", "Rows examined by scan cursors.", snapshot.scan_rows_read_total);
    write_counter(out,
                  "rowscan_scan_rows_visible_total",
                  "Rows produced by scan cursors after visibility filtering.",
                  snapshot.scan_rows_visible_total);

    out << "# HELP rowscan_scan_visible_ratio Share of examined rows visible to the reading session.\n";
    out << "# TYPE rowscan_scan_visible_ratio gauge\n";
    out << "rowscan_scan_visible_ratio " << format_double(snapshot.scan_visible_ratio) << '\n';

    out << "# HELP rowscan_scan_latency_seconds Summary of cursor step latency.\n";
    out << "# TYPE rowscan_scan_latency_seconds summary\n";
    out << "rowscan_scan_latency_seconds_sum " << format_double(snapshot.scan_latency_total_seconds) << '\n';
    out << "rowscan_scan_latency_seconds_count " << snapshot.scan_latency_count << '\n';

    out << "# HELP rowscan_scan_latency_last_seconds Latest cursor step latency sample.\n";
    out << "# TYPE rowscan_scan_latency_last_seconds gauge\n";
    out << "rowscan_scan_latency_last_seconds " << format_double(snapshot.scan_latency_last_seconds) << '\n';

    out << "# HELP rowscan_metrics_scrape_timestamp_seconds Wall clock time when the metrics snapshot was generated.\n";
    out << "# TYPE rowscan_metrics_scrape_timestamp_seconds gauge\n";
    out << "rowscan_metrics_scrape_timestamp_seconds " << format_double(wall_seconds) << '\n';

    return out.str();
}

}  // namespace rowscan::storage

#include "rowscan/storage/storage_telemetry_registry.hpp"

#include <algorithm>
#include <atomic>
#include <utility>
#include <vector>

namespace rowscan::storage {

namespace {

void accumulate_latency(ScanIndexTelemetrySnapshot::OperationLatencySnapshot& lhs,
                        const ScanIndexTelemetrySnapshot::OperationLatencySnapshot& rhs)
{
    lhs.invocations += rhs.invocations;
    lhs.total_duration_ns += rhs.total_duration_ns;
    lhs.last_duration_ns = std::max(lhs.last_duration_ns, rhs.last_duration_ns);
}

ScanIndexTelemetrySnapshot& accumulate(ScanIndexTelemetrySnapshot& target, const ScanIndexTelemetrySnapshot& source)
{
    target.rows_added += source.rows_added;
    target.slots_reused += source.slots_reused;
    target.rows_removed += source.rows_removed;
    target.store_resets += source.store_resets;
    target.rows_retired += source.rows_retired;
    target.commits += source.commits;
    target.completed_commits += source.completed_commits;
    target.rollbacks += source.rollbacks;
    target.truncates += source.truncates;
    target.cursors_opened += source.cursors_opened;
    target.cursor_rows_read += source.cursor_rows_read;
    target.cursor_rows_visible += source.cursor_rows_visible;
    target.failures += source.failures;

    accumulate_latency(target.add_latency, source.add_latency);
    accumulate_latency(target.remove_latency, source.remove_latency);
    accumulate_latency(target.commit_latency, source.commit_latency);
    accumulate_latency(target.rollback_latency, source.rollback_latency);
    accumulate_latency(target.truncate_latency, source.truncate_latency);
    accumulate_latency(target.scan_latency, source.scan_latency);
    return target;
}

std::atomic<StorageTelemetryRegistry*> g_global_storage_registry{nullptr};

}  // namespace

void StorageTelemetryRegistry::register_scan_index(std::string identifier, ScanIndexSampler sampler)
{
    if (!sampler) {
        return;
    }
    std::lock_guard guard(mutex_);
    scan_index_samplers_.insert_or_assign(std::move(identifier), std::move(sampler));
}

void StorageTelemetryRegistry::unregister_scan_index(const std::string& identifier)
{
    std::lock_guard guard(mutex_);
    scan_index_samplers_.erase(identifier);
}

ScanIndexTelemetrySnapshot StorageTelemetryRegistry::aggregate_scan_indexes() const
{
    std::vector<ScanIndexSampler> samplers;
    {
        std::lock_guard guard(mutex_);
        samplers.reserve(scan_index_samplers_.size());
        for (const auto& [_, sampler] : scan_index_samplers_) {
            samplers.push_back(sampler);
        }
    }

    ScanIndexTelemetrySnapshot total{};
    for (const auto& sampler : samplers) {
        if (!sampler) {
            continue;
        }
        accumulate(total, sampler());
    }
    return total;
}

void StorageTelemetryRegistry::visit_scan_indexes(const ScanIndexVisitor& visitor) const
{
    if (!visitor) {
        return;
    }

    std::vector<std::pair<std::string, ScanIndexSampler>> entries;
    {
        std::lock_guard guard(mutex_);
        entries.reserve(scan_index_samplers_.size());
        for (const auto& [identifier, sampler] : scan_index_samplers_) {
            entries.emplace_back(identifier, sampler);
        }
    }

    for (const auto& [identifier, sampler] : entries) {
        if (!sampler) {
            continue;
        }
        visitor(identifier, sampler());
    }
}

StorageTelemetryRegistry* get_global_storage_telemetry_registry() noexcept
{
    return g_global_storage_registry.load(std::memory_order_acquire);
}

void set_global_storage_telemetry_registry(StorageTelemetryRegistry* registry) noexcept
{
    g_global_storage_registry.store(registry, std::memory_order_release);
}

}  // namespace rowscan::storage

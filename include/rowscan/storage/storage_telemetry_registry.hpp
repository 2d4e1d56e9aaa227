#pragma once

#include "rowscan/storage/scan_index_telemetry.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace rowscan::storage {

class StorageTelemetryRegistry final {
public:
    using ScanIndexSampler = std::function<ScanIndexTelemetrySnapshot()>;
    using ScanIndexVisitor = std::function<void(const std::string&, const ScanIndexTelemetrySnapshot&)>;

    void register_scan_index(std::string identifier, ScanIndexSampler sampler);
    void unregister_scan_index(const std::string& identifier);
    ScanIndexTelemetrySnapshot aggregate_scan_indexes() const;
    void visit_scan_indexes(const ScanIndexVisitor& visitor) const;

private:
    mutable std::mutex mutex_{};
    std::unordered_map<std::string, ScanIndexSampler> scan_index_samplers_{};
};

StorageTelemetryRegistry* get_global_storage_telemetry_registry() noexcept;
void set_global_storage_telemetry_registry(StorageTelemetryRegistry* registry) noexcept;

}  // namespace rowscan::storage

#include "metricdb/storage/point_store.h"
#include "metricdb/common/logger.h"
#include <cmath>
#include <mutex>

namespace metricdb {
namespace storage {

PointStore::PointStore(std::shared_ptr<catalog::MetricCatalog> catalog,
                       const core::StorageConfig& storage_config,
                       const core::QueryConfig& query_config)
    : catalog_(std::move(catalog)),
      storage_config_(storage_config),
      query_config_(query_config) {
    if (!catalog_) {
        throw core::InvalidArgumentError("PointStore requires a metric catalog");
    }
}

std::shared_ptr<MetricPartition> PointStore::find_partition(const std::string& metric) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = partitions_.find(metric);
    if (it == partitions_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<MetricPartition> PointStore::get_or_create_partition(const std::string& metric) {
    auto existing = find_partition(metric);
    if (existing) {
        return existing;
    }
    
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& slot = partitions_[metric];
    if (!slot) {
        slot = std::make_shared<MetricPartition>(storage_config_.initial_partition_capacity);
    }
    return slot;
}

core::Result<size_t> PointStore::insert_batch(const std::string& metric,
                                              std::vector<core::Point> points,
                                              const SourceContext& source) {
    auto descriptor_result = catalog_->lookup(metric);
    if (!descriptor_result.ok()) {
        return core::Result<size_t>::error(descriptor_result.code(), descriptor_result.error());
    }
    const auto& descriptor = descriptor_result.value();
    
    // Validate the whole batch before anything is written
    for (size_t i = 0; i < points.size(); ++i) {
        auto& point = points[i];
        if (!std::isfinite(point.timestamp()) || !std::isfinite(point.value())) {
            return core::Result<size_t>::error(core::Error::Code::INVALID_ARGUMENT,
                "Point " + std::to_string(i) + " of batch for '" + metric + "' has a non-finite time or value");
        }
        
        if (descriptor.auto_primary_tag_key && !point.tags().has(*descriptor.auto_primary_tag_key)) {
            if (source.identity.empty()) {
                return core::Result<size_t>::error(core::Error::Code::INVALID_ARGUMENT,
                    "Metric '" + metric + "' requires tag '" + *descriptor.auto_primary_tag_key +
                    "' but the insert has no source identity");
            }
            point.mutable_tags().add(*descriptor.auto_primary_tag_key, source.identity);
        }
    }
    
    if (points.empty()) {
        return core::Result<size_t>(0);
    }
    
    auto partition = get_or_create_partition(metric);
    size_t inserted = partition->append(std::move(points));
    
    METRICDB_DEBUG("Inserted {} points into '{}' from source '{}'", inserted, metric, source.identity);
    return core::Result<size_t>(inserted);
}

core::Result<std::vector<core::Point>> PointStore::scan(const std::string& metric,
                                                        const core::TimeRange& range,
                                                        const std::vector<core::Tag>& filter,
                                                        const core::QueryContext& context) const {
    using ScanResult = core::Result<std::vector<core::Point>>;
    
    if (range.end < range.start) {
        return ScanResult::error(core::Error::Code::INVALID_ARGUMENT, "Time range end is before start");
    }
    if (!catalog_->contains(metric)) {
        return ScanResult::error(core::Error::Code::NOT_FOUND, "Metric '" + metric + "' not found");
    }
    
    auto partition = find_partition(metric);
    if (!partition) {
        return ScanResult(std::vector<core::Point>());
    }
    
    try {
        return ScanResult(partition->scan(range, filter, context, query_config_.scan_check_interval));
    } catch (const core::Error& e) {
        return ScanResult::from_error(e);
    }
}

core::Result<size_t> PointStore::size(const std::string& metric) const {
    if (!catalog_->contains(metric)) {
        return core::Result<size_t>::error(core::Error::Code::NOT_FOUND, "Metric '" + metric + "' not found");
    }
    auto partition = find_partition(metric);
    return core::Result<size_t>(partition ? partition->size() : 0);
}

core::Result<std::vector<std::string>> PointStore::tag_values(const std::string& metric,
                                                               const std::string& key) const {
    using ValuesResult = core::Result<std::vector<std::string>>;
    if (!catalog_->contains(metric)) {
        return ValuesResult::error(core::Error::Code::NOT_FOUND, "Metric '" + metric + "' not found");
    }
    auto partition = find_partition(metric);
    if (!partition) {
        return ValuesResult(std::vector<std::string>());
    }
    return ValuesResult(partition->tag_values(key));
}

} // namespace storage
} // namespace metricdb

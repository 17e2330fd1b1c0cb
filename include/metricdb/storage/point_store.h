#ifndef METRICDB_STORAGE_POINT_STORE_H_
#define METRICDB_STORAGE_POINT_STORE_H_

#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "metricdb/catalog/metric_catalog.h"
#include "metricdb/core/config.h"
#include "metricdb/core/query_context.h"
#include "metricdb/core/result.h"
#include "metricdb/core/types.h"
#include "metricdb/storage/metric_partition.h"

namespace metricdb {
namespace storage {

/**
 * @brief Identity of the client inserting a batch
 */
struct SourceContext {
    std::string identity;
};

/**
 * @brief Per-metric point storage
 *
 * Each metric owns a MetricPartition with its own writer lock: appends to one
 * metric are serialized while different metrics are written in parallel.
 */
class PointStore {
public:
    PointStore(std::shared_ptr<catalog::MetricCatalog> catalog,
               const core::StorageConfig& storage_config = core::StorageConfig::Default(),
               const core::QueryConfig& query_config = core::QueryConfig::Default());
    
    PointStore(const PointStore&) = delete;
    PointStore& operator=(const PointStore&) = delete;
    
    /**
     * @brief Validate and append a batch of points
     *
     * Points lacking the metric's auto-primary-tag key receive
     * key:source.identity. The batch is rejected as a whole (nothing written)
     * on an unknown metric, a non-finite timestamp or value, or an auto tag
     * that cannot be populated.
     *
     * @return Number of points inserted
     */
    core::Result<size_t> insert_batch(const std::string& metric,
                                      std::vector<core::Point> points,
                                      const SourceContext& source);
    
    /**
     * @brief Points in [range.start, range.end) matching every filter tag
     *
     * Ascending by timestamp. Fails with NOT_FOUND for an unregistered metric,
     * TIMEOUT/CANCELLED when the context expires mid-scan.
     */
    core::Result<std::vector<core::Point>> scan(const std::string& metric,
                                                const core::TimeRange& range,
                                                const std::vector<core::Tag>& filter,
                                                const core::QueryContext& context) const;
    
    core::Result<size_t> size(const std::string& metric) const;
    core::Result<std::vector<std::string>> tag_values(const std::string& metric,
                                                      const std::string& key) const;
    
    const catalog::MetricCatalog& catalog() const { return *catalog_; }

private:
    std::shared_ptr<MetricPartition> find_partition(const std::string& metric) const;
    std::shared_ptr<MetricPartition> get_or_create_partition(const std::string& metric);
    
    std::shared_ptr<catalog::MetricCatalog> catalog_;
    core::StorageConfig storage_config_;
    core::QueryConfig query_config_;
    
    absl::flat_hash_map<std::string, std::shared_ptr<MetricPartition>> partitions_;
    mutable std::shared_mutex mutex_;  // Protects partitions_ only
};

} // namespace storage
} // namespace metricdb

#endif // METRICDB_STORAGE_POINT_STORE_H_

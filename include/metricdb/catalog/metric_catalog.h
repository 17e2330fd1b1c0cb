#ifndef METRICDB_CATALOG_METRIC_CATALOG_H_
#define METRICDB_CATALOG_METRIC_CATALOG_H_

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "metricdb/core/types.h"
#include "metricdb/core/result.h"

namespace metricdb {
namespace catalog {

/**
 * @brief Registered metric definition
 */
struct MetricDescriptor {
    std::string name;
    core::MetricKind kind = core::MetricKind::GAUGE;
    std::optional<std::string> auto_primary_tag_key;
};

/**
 * @brief Registry of metric name to kind and auto-primary-tag key
 *
 * Kinds are immutable once registered. Lookups return copies so callers
 * never hold references into the registry.
 */
class MetricCatalog {
public:
    MetricCatalog() = default;
    
    MetricCatalog(const MetricCatalog&) = delete;
    MetricCatalog& operator=(const MetricCatalog&) = delete;
    
    /**
     * @brief Create the metric, or succeed if it already exists with the same kind
     *
     * Fails with CONFLICT if the metric exists with a different kind and with
     * INVALID_ARGUMENT on an empty name.
     */
    core::Result<void> register_metric(const std::string& name, core::MetricKind kind);
    
    /**
     * @brief Set (or overwrite) the tag key populated from the ingestion source
     */
    core::Result<void> set_auto_primary_tag(const std::string& name, const std::string& key);
    
    core::Result<MetricDescriptor> lookup(const std::string& name) const;
    bool contains(const std::string& name) const;
    
    // Sorted by name
    std::vector<MetricDescriptor> list() const;
    size_t size() const;

private:
    std::map<std::string, MetricDescriptor> metrics_;
    mutable std::shared_mutex mutex_;
};

} // namespace catalog
} // namespace metricdb

#endif // METRICDB_CATALOG_METRIC_CATALOG_H_

#include "metricdb/catalog/metric_catalog.h"
#include "metricdb/common/logger.h"
#include <mutex>

namespace metricdb {
namespace catalog {

core::Result<void> MetricCatalog::register_metric(const std::string& name, core::MetricKind kind) {
    if (name.empty()) {
        return core::Result<void>::error(core::Error::Code::INVALID_ARGUMENT, "Metric name cannot be empty");
    }
    
    std::unique_lock<std::shared_mutex> lock(mutex_);
    
    auto it = metrics_.find(name);
    if (it != metrics_.end()) {
        if (it->second.kind != kind) {
            METRICDB_WARN("Rejected re-registration of metric '{}' as {} (registered as {})",
                          name, core::MetricKindName(kind), core::MetricKindName(it->second.kind));
            return core::Result<void>::error(core::Error::Code::CONFLICT,
                "Metric '" + name + "' already exists with kind " + core::MetricKindName(it->second.kind));
        }
        return core::Result<void>();
    }
    
    MetricDescriptor descriptor;
    descriptor.name = name;
    descriptor.kind = kind;
    metrics_.emplace(name, std::move(descriptor));
    
    METRICDB_INFO("Registered {} metric '{}'", core::MetricKindName(kind), name);
    return core::Result<void>();
}

core::Result<void> MetricCatalog::set_auto_primary_tag(const std::string& name, const std::string& key) {
    if (key.empty()) {
        return core::Result<void>::error(core::Error::Code::INVALID_ARGUMENT, "Auto primary tag key cannot be empty");
    }
    
    std::unique_lock<std::shared_mutex> lock(mutex_);
    
    auto it = metrics_.find(name);
    if (it == metrics_.end()) {
        return core::Result<void>::error(core::Error::Code::NOT_FOUND, "Metric '" + name + "' not found");
    }
    
    it->second.auto_primary_tag_key = key;
    METRICDB_INFO("Metric '{}' auto primary tag key set to '{}'", name, key);
    return core::Result<void>();
}

core::Result<MetricDescriptor> MetricCatalog::lookup(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    
    auto it = metrics_.find(name);
    if (it == metrics_.end()) {
        return core::Result<MetricDescriptor>::error(core::Error::Code::NOT_FOUND, "Metric '" + name + "' not found");
    }
    return core::Result<MetricDescriptor>(it->second);
}

bool MetricCatalog::contains(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return metrics_.find(name) != metrics_.end();
}

std::vector<MetricDescriptor> MetricCatalog::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    
    std::vector<MetricDescriptor> result;
    result.reserve(metrics_.size());
    for (const auto& [name, descriptor] : metrics_) {
        result.push_back(descriptor);
    }
    return result;
}

size_t MetricCatalog::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return metrics_.size();
}

} // namespace catalog
} // namespace metricdb

#ifndef METRICDB_API_METRICS_SERVICE_H_
#define METRICDB_API_METRICS_SERVICE_H_

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "metricdb/api/requests.h"
#include "metricdb/catalog/metric_catalog.h"
#include "metricdb/core/config.h"
#include "metricdb/core/result.h"
#include "metricdb/query/planner.h"
#include "metricdb/storage/point_store.h"

namespace metricdb {
namespace api {

/**
 * @brief Configuration handed to the service by its host
 */
struct ServiceConfig {
    core::EngineConfig engine;
    spdlog::level::level_enum log_level;
    std::string default_source;  // Source identity for inserts that carry none
    
    ServiceConfig() : engine(core::EngineConfig::Default()), log_level(spdlog::level::info), default_source("default") {}
    
    static ServiceConfig Default() {
        return ServiceConfig();
    }
};

/**
 * @brief Request/response boundary of the metrics engine
 *
 * Every operation returns a Result; nothing throws past this class.
 */
class MetricsService {
public:
    explicit MetricsService(const ServiceConfig& config = ServiceConfig::Default());
    
    MetricsService(const MetricsService&) = delete;
    MetricsService& operator=(const MetricsService&) = delete;
    
    core::Result<void> RegisterMetric(const RegisterMetricRequest& request);
    core::Result<void> SetAutoPrimaryTag(const SetAutoPrimaryTagRequest& request);
    
    /**
     * @return Number of points inserted
     */
    core::Result<size_t> InsertBatch(const InsertBatchRequest& request);
    
    core::Result<query::QueryResponse> LegacyQuery(const LegacyQueryRequest& request) const;
    core::Result<query::QueryResponse> ExpressionQuery(const ExpressionQueryRequest& request) const;
    
    std::vector<catalog::MetricDescriptor> ListMetrics() const;
    
    const ServiceConfig& config() const { return config_; }

private:
    core::QueryContext MakeContext(const QueryOptions& options) const;
    
    ServiceConfig config_;
    std::shared_ptr<catalog::MetricCatalog> catalog_;
    std::unique_ptr<storage::PointStore> store_;
    std::unique_ptr<query::QueryPlanner> planner_;
};

} // namespace api
} // namespace metricdb

#endif // METRICDB_API_METRICS_SERVICE_H_

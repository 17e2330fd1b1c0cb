#include "metricdb/api/metrics_service.h"
#include "metricdb/common/logger.h"
#include "metricdb/core/error.h"

namespace metricdb {
namespace api {

MetricsService::MetricsService(const ServiceConfig& config)
    : config_(config),
      catalog_(std::make_shared<catalog::MetricCatalog>()) {
    common::Logger::Init();
    common::Logger::SetLevel(config_.log_level);
    
    store_ = std::make_unique<storage::PointStore>(catalog_, config_.engine.storage, config_.engine.query);
    planner_ = std::make_unique<query::QueryPlanner>(store_.get(), config_.engine);
    
    METRICDB_INFO("Metrics service started (default timeout {}ms, max buckets {})",
                  config_.engine.query.default_timeout.count(), config_.engine.query.max_buckets);
}

core::Result<void> MetricsService::RegisterMetric(const RegisterMetricRequest& request) {
    return catalog_->register_metric(request.name, request.kind);
}

core::Result<void> MetricsService::SetAutoPrimaryTag(const SetAutoPrimaryTagRequest& request) {
    return catalog_->set_auto_primary_tag(request.metric, request.key);
}

core::Result<size_t> MetricsService::InsertBatch(const InsertBatchRequest& request) {
    auto descriptor = catalog_->lookup(request.metric);
    if (!descriptor.ok()) {
        return core::Result<size_t>::error(descriptor.code(), descriptor.error());
    }
    if (descriptor.value().kind != request.kind) {
        METRICDB_WARN("Rejected {} insert into {} metric '{}'", core::MetricKindName(request.kind),
                      core::MetricKindName(descriptor.value().kind), request.metric);
        return core::Result<size_t>::error(core::Error::Code::INVALID_ARGUMENT,
            "wrong metric type: '" + request.metric + "' is a " + core::MetricKindName(descriptor.value().kind));
    }
    
    std::vector<core::Point> points;
    points.reserve(request.entries.size());
    try {
        for (const auto& entry : request.entries) {
            points.emplace_back(entry.time, entry.value, core::Tags::Parse(entry.tags));
        }
    } catch (const core::Error& e) {
        return core::Result<size_t>::from_error(e);
    }
    
    storage::SourceContext source;
    source.identity = request.source.value_or(config_.default_source);
    
    try {
        return store_->insert_batch(request.metric, std::move(points), source);
    } catch (const core::Error& e) {
        return core::Result<size_t>::from_error(e);
    } catch (const std::exception& e) {
        METRICDB_ERROR("Insert into '{}' failed unexpectedly: {}", request.metric, e.what());
        return core::Result<size_t>::error(core::Error::Code::INTERNAL, e.what());
    }
}

core::QueryContext MetricsService::MakeContext(const QueryOptions& options) const {
    return core::QueryContext(options.timeout.value_or(config_.engine.query.default_timeout),
                              options.cancellation);
}

core::Result<query::QueryResponse> MetricsService::LegacyQuery(const LegacyQueryRequest& request) const {
    auto context = MakeContext(request.options);
    return planner_->execute(request.query, context);
}

core::Result<query::QueryResponse> MetricsService::ExpressionQuery(const ExpressionQueryRequest& request) const {
    auto context = MakeContext(request.options);
    return planner_->execute(request.query, context);
}

std::vector<catalog::MetricDescriptor> MetricsService::ListMetrics() const {
    return catalog_->list();
}

} // namespace api
} // namespace metricdb

#include "metricdb/query/planner.h"
#include "metricdb/common/logger.h"
#include "metricdb/core/error.h"
#include "metricdb/query/evaluator.h"
#include "metricdb/query/output_filter.h"
#include <cmath>

namespace metricdb {
namespace query {

namespace {

// Tracks the state of one query and logs every transition
class QueryExecution {
public:
    QueryExecution(uint64_t id, const char* kind) : id_(id), state_(QueryState::PARSED) {
        METRICDB_DEBUG("Query {} ({}): {}", id_, kind, QueryStateName(state_));
    }
    
    void advance(QueryState next) {
        METRICDB_DEBUG("Query {}: {} -> {}", id_, QueryStateName(state_), QueryStateName(next));
        state_ = next;
    }
    
    QueryState state() const { return state_; }
    uint64_t id() const { return id_; }

private:
    uint64_t id_;
    QueryState state_;
};

template<typename Body>
core::Result<QueryResponse> Run(uint64_t id, const char* kind, const core::QueryContext& context, Body&& body) {
    QueryExecution execution(id, kind);
    try {
        QueryResponse response = body(execution);
        execution.advance(QueryState::RESPONDED);
        response.stats.final_state = execution.state();
        response.stats.elapsed = context.elapsed();
        return core::Result<QueryResponse>(std::move(response));
    } catch (const core::Error& e) {
        QueryState failed_in = execution.state();
        execution.advance(QueryState::FAILED);
        METRICDB_INFO("Query {} failed in state {}: {} ({})", id, QueryStateName(failed_in),
                      e.what(), core::ErrorCodeName(e.code()));
        return core::Result<QueryResponse>::from_error(e);
    } catch (const std::exception& e) {
        execution.advance(QueryState::FAILED);
        METRICDB_ERROR("Query {} failed unexpectedly: {}", id, e.what());
        return core::Result<QueryResponse>::error(core::Error::Code::INTERNAL, e.what());
    }
}

void Resolve(const storage::PointStore& store, const std::string& metric) {
    if (!store.catalog().contains(metric)) {
        throw core::NotFoundError("Metric '" + metric + "' not found");
    }
}

QueryResponse ToResponse(Value value) {
    QueryResponse response;
    if (value.isScalar()) {
        // Constants alone have no buckets to emit
        response.series.push_back(LabeledSeries{std::nullopt, core::Series()});
        return response;
    }
    response.grouped = value.grouped;
    response.series = std::move(value.series);
    return response;
}

} // namespace

const char* QueryStateName(QueryState state) {
    switch (state) {
        case QueryState::PARSED: return "Parsed";
        case QueryState::RESOLVED: return "Resolved";
        case QueryState::AGGREGATED: return "Aggregated";
        case QueryState::EVALUATED: return "Evaluated";
        case QueryState::FILTERED: return "Filtered";
        case QueryState::RESPONDED: return "Responded";
        case QueryState::FAILED: return "Failed";
    }
    return "Unknown";
}

QueryPlanner::QueryPlanner(const storage::PointStore* store, const core::EngineConfig& config)
    : store_(store),
      config_(config),
      partitioner_(config.storage.ungrouped_label),
      aggregator_(config.query) {
    if (!store_) {
        throw core::InvalidArgumentError("QueryPlanner requires a point store");
    }
}

core::Duration QueryPlanner::EffectiveDuration(const core::TimeRange& range,
                                               const std::optional<core::Duration>& duration) {
    if (duration) {
        return *duration;
    }
    core::Duration length = range.length();
    if (std::isfinite(length) && length > 0) {
        return length;
    }
    // Empty or invalid range; the range check reports the latter
    return 1.0;
}

core::Result<QueryResponse> QueryPlanner::execute(const LegacyQuery& query,
                                                  const core::QueryContext& context) const {
    return Run(next_query_id_++, "legacy", context, [&](QueryExecution& execution) {
        if (query.metric.empty()) {
            throw core::InvalidArgumentError("Query has an empty metric name");
        }
        if (query.query.group_by && query.query.group_by->empty()) {
            throw core::InvalidArgumentError("group_by key is empty");
        }
        const core::Duration duration = EffectiveDuration(query.range, query.duration);
        WindowAggregator::Validate(query.range, duration, query.aggregation);
        OutputFilter::ValidateTransform(query.query.output_transform.get());
        OutputFilter::Validate(query.query.output_filter.get());
        
        Resolve(*store_, query.metric);
        execution.advance(QueryState::RESOLVED);
        context.check();
        
        ExpressionEvaluator evaluator(store_, &partitioner_, &aggregator_, query.range, duration, &context);
        Value value = evaluator.AggregateMetric(query.metric, query.aggregation,
                                                query.query.group_by, query.query.tags);
        execution.advance(QueryState::AGGREGATED);
        
        OutputFilter::Transform(query.query.output_transform.get(), value.series);
        execution.advance(QueryState::EVALUATED);
        
        OutputFilter::Apply(query.query.output_filter.get(), value.series);
        execution.advance(QueryState::FILTERED);
        
        QueryResponse response = ToResponse(std::move(value));
        response.stats.points_scanned = evaluator.points_scanned();
        return response;
    });
}

core::Result<QueryResponse> QueryPlanner::execute(const ExpressionQuery& query,
                                                  const core::QueryContext& context) const {
    return Run(next_query_id_++, "expression", context, [&](QueryExecution& execution) {
        ExpressionEvaluator::Validate(query.expression.get());
        OutputFilter::Validate(query.output_filter.get());
        const core::Duration duration = EffectiveDuration(query.range, query.duration);
        WindowAggregator::Validate(query.range, duration, core::AggregationRequest());
        
        for (const auto& metric : ExpressionEvaluator::ReferencedMetrics(query.expression.get())) {
            Resolve(*store_, metric);
        }
        execution.advance(QueryState::RESOLVED);
        context.check();
        
        ExpressionEvaluator evaluator(store_, &partitioner_, &aggregator_, query.range, duration, &context);
        evaluator.Prepare(query.expression.get());
        execution.advance(QueryState::AGGREGATED);
        
        Value value = evaluator.Evaluate(query.expression.get());
        execution.advance(QueryState::EVALUATED);
        
        OutputFilter::Apply(query.output_filter.get(), value.series);
        execution.advance(QueryState::FILTERED);
        
        QueryResponse response = ToResponse(std::move(value));
        response.stats.points_scanned = evaluator.points_scanned();
        return response;
    });
}

} // namespace query
} // namespace metricdb

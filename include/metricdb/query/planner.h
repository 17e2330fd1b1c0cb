#ifndef METRICDB_QUERY_PLANNER_H_
#define METRICDB_QUERY_PLANNER_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "metricdb/core/config.h"
#include "metricdb/core/query_context.h"
#include "metricdb/core/result.h"
#include "metricdb/core/types.h"
#include "metricdb/query/ast.h"
#include "metricdb/query/group_partitioner.h"
#include "metricdb/query/value.h"
#include "metricdb/query/window_aggregator.h"
#include "metricdb/storage/point_store.h"

namespace metricdb {
namespace query {

enum class QueryState {
    PARSED,
    RESOLVED,
    AGGREGATED,
    EVALUATED,
    FILTERED,
    RESPONDED,
    FAILED
};

const char* QueryStateName(QueryState state);

/**
 * @brief Single-metric aggregation over a time range
 */
struct LegacyQuery {
    std::string metric;
    core::AggregationRequest aggregation;
    std::optional<core::Duration> duration;   // Whole range as one bucket when absent
    core::TimeRange range;
    MetricQuery query;
};

/**
 * @brief Expression over one or more metrics, evaluated on a shared bucket grid
 */
struct ExpressionQuery {
    core::TimeRange range;
    std::optional<core::Duration> duration;   // Whole range as one bucket when absent
    std::unique_ptr<ExprNode> expression;
    std::unique_ptr<FilterNode> output_filter; // Applied to the combined result
};

struct QueryStats {
    QueryState final_state = QueryState::PARSED;
    std::chrono::milliseconds elapsed{0};
    size_t points_scanned = 0;
};

/**
 * @brief Query result: one unlabeled series, or labeled series per group
 */
struct QueryResponse {
    bool grouped = false;
    std::vector<LabeledSeries> series;
    QueryStats stats;
};

/**
 * @brief Drives a query through Parsed, Resolved, Aggregated, Evaluated,
 *        Filtered and Responded, or to Failed from any of them
 *
 * Errors never carry partial data.
 */
class QueryPlanner {
public:
    QueryPlanner(const storage::PointStore* store, const core::EngineConfig& config);
    
    core::Result<QueryResponse> execute(const LegacyQuery& query, const core::QueryContext& context) const;
    core::Result<QueryResponse> execute(const ExpressionQuery& query, const core::QueryContext& context) const;
    
    /**
     * @brief Window length to use: the requested one, or the whole range
     */
    static core::Duration EffectiveDuration(const core::TimeRange& range,
                                            const std::optional<core::Duration>& duration);

private:
    const storage::PointStore* store_;
    core::EngineConfig config_;
    GroupPartitioner partitioner_;
    WindowAggregator aggregator_;
    mutable std::atomic<uint64_t> next_query_id_{1};
};

} // namespace query
} // namespace metricdb

#endif // METRICDB_QUERY_PLANNER_H_

#ifndef METRICDB_QUERY_EVALUATOR_H_
#define METRICDB_QUERY_EVALUATOR_H_

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "metricdb/core/query_context.h"
#include "metricdb/core/types.h"
#include "metricdb/query/ast.h"
#include "metricdb/query/group_partitioner.h"
#include "metricdb/query/value.h"
#include "metricdb/query/window_aggregator.h"
#include "metricdb/storage/point_store.h"

namespace metricdb {
namespace query {

/**
 * @brief Evaluates expression trees over windowed metric aggregates
 *
 * Metric references are scanned, grouped and aggregated into bucket series.
 * Constants carry no timestamps and are broadcast onto the buckets of the
 * other operands. Operands are joined on bucket timestamps; a bucket missing
 * on either side, or whose combined value is undefined, is dropped.
 */
class ExpressionEvaluator {
public:
    ExpressionEvaluator(const storage::PointStore* store,
                        const GroupPartitioner* partitioner,
                        const WindowAggregator* aggregator,
                        const core::TimeRange& range,
                        core::Duration duration,
                        const core::QueryContext* context);
    
    /**
     * @brief Scan, group and aggregate a single metric
     * @throws NotFoundError, TimeoutError, CancelledError, InvalidArgumentError
     */
    Value AggregateMetric(const std::string& metric,
                          const core::AggregationRequest& aggregation,
                          const std::optional<std::string>& group_by,
                          const std::vector<core::Tag>& tags);
    
    /**
     * @brief Aggregate every metric reference of the tree ahead of evaluation
     */
    void Prepare(const ExprNode* root);
    
    /**
     * @brief Evaluate the tree; references not prepared are aggregated on demand
     */
    Value Evaluate(const ExprNode* node);
    
    size_t points_scanned() const { return points_scanned_; }
    
    /**
     * @brief Reject trees that can never be evaluated (missing children,
     *        function arity, empty metric names, percentile out of range)
     * @throws InvalidArgumentError
     */
    static void Validate(const ExprNode* node);
    
    // Metric names referenced by the tree, in first-seen order without repeats
    static std::vector<std::string> ReferencedMetrics(const ExprNode* node);
    
    using Combiner = std::function<std::optional<double>(const std::vector<double>&)>;
    
    /**
     * @brief Align operands by group and timestamp and combine them pointwise
     * @throws InvalidArgumentError when two grouped operands have different groups
     */
    static Value Combine(const std::vector<Value>& operands,
                         const Combiner& combiner,
                         const core::QueryContext& context);

private:
    Value EvaluateMetricRef(const MetricRefNode* node);
    Value EvaluateValue(const ValueNode* node);
    Value EvaluateArithmetic(const ArithmeticNode* node);
    Value EvaluateFunction(const FunctionNode* node);
    
    const storage::PointStore* store_;
    const GroupPartitioner* partitioner_;
    const WindowAggregator* aggregator_;
    core::TimeRange range_;
    core::Duration duration_;
    const core::QueryContext* context_;
    
    std::unordered_map<const MetricRefNode*, Value> prepared_;
    size_t points_scanned_ = 0;
};

} // namespace query
} // namespace metricdb

#endif // METRICDB_QUERY_EVALUATOR_H_

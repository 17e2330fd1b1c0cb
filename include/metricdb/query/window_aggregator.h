#ifndef METRICDB_QUERY_WINDOW_AGGREGATOR_H_
#define METRICDB_QUERY_WINDOW_AGGREGATOR_H_

#include <vector>

#include "metricdb/core/aggregation.h"
#include "metricdb/core/config.h"
#include "metricdb/core/query_context.h"
#include "metricdb/core/types.h"

namespace metricdb {
namespace query {

/**
 * @brief One non-empty window [start, end) and its reduced value
 */
struct Bucket {
    core::Timestamp start;
    core::Timestamp end;
    core::Value value;
    size_t count;
};

/**
 * @brief Reduces points into fixed-duration windows aligned to the range start
 *
 * Bucket i covers [start + i*D, start + (i+1)*D), the last one clipped at the
 * range end. Buckets without points are omitted.
 */
class WindowAggregator {
public:
    explicit WindowAggregator(const core::QueryConfig& config = core::QueryConfig::Default());
    
    /**
     * @brief Aggregate points (ascending by timestamp) over the range
     *
     * Points outside the range are ignored.
     *
     * @throws InvalidArgumentError on duration <= 0, end < start, a percentile
     *         outside [0, 100] or too many buckets
     * @throws TimeoutError, CancelledError from the context, checked per bucket
     */
    std::vector<Bucket> aggregate(const std::vector<core::Point>& points,
                                  const core::TimeRange& range,
                                  core::Duration duration,
                                  const core::AggregationRequest& aggregation,
                                  const core::QueryContext& context) const;
    
    /**
     * @brief Same as aggregate(), emitting (window start, value) samples
     */
    core::Series aggregate_series(const std::vector<core::Point>& points,
                                  const core::TimeRange& range,
                                  core::Duration duration,
                                  const core::AggregationRequest& aggregation,
                                  const core::QueryContext& context) const;
    
    /**
     * @brief Reduce a non-empty set of values; may reorder the values
     */
    static core::Value Reduce(std::vector<core::Value>& values,
                              const core::AggregationRequest& aggregation);
    
    /**
     * @throws InvalidArgumentError when the request can never be aggregated
     */
    static void Validate(const core::TimeRange& range,
                         core::Duration duration,
                         const core::AggregationRequest& aggregation);

private:
    core::QueryConfig config_;
};

} // namespace query
} // namespace metricdb

#endif // METRICDB_QUERY_WINDOW_AGGREGATOR_H_

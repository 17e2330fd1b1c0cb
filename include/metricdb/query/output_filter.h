#ifndef METRICDB_QUERY_OUTPUT_FILTER_H_
#define METRICDB_QUERY_OUTPUT_FILTER_H_

#include <optional>
#include <vector>

#include "metricdb/core/types.h"
#include "metricdb/query/ast.h"
#include "metricdb/query/value.h"

namespace metricdb {
namespace query {

/**
 * @brief Post-aggregation predicate applied per output point, per group
 */
class OutputFilter {
public:
    /**
     * @brief Reject trees that can never be evaluated
     * @throws InvalidArgumentError on missing children or a function arity mismatch
     */
    static void Validate(const FilterNode* filter);
    
    // Same checks for a per-value output transform; null is allowed
    static void ValidateTransform(const TransformNode* transform);
    
    /**
     * @brief Value of a transform for one input; empty when undefined (e.g. x / 0)
     */
    static std::optional<double> EvaluateTransform(const TransformNode* node, double input);
    
    /**
     * @brief True if the point is kept; a null filter keeps everything
     */
    static bool Matches(const FilterNode* filter, double input);
    
    static core::Series Apply(const FilterNode* filter, const core::Series& samples);
    
    // Filters every series in place; a series may become empty but is kept
    static void Apply(const FilterNode* filter, std::vector<LabeledSeries>& series);
    
    /**
     * @brief Map every value through an output transform
     *
     * Samples whose transformed value is undefined are dropped. A null
     * transform leaves the samples untouched.
     */
    static core::Series Transform(const TransformNode* transform, const core::Series& samples);
    static void Transform(const TransformNode* transform, std::vector<LabeledSeries>& series);

private:
    static void ValidateNode(const TransformNode* node);
};

} // namespace query
} // namespace metricdb

#endif // METRICDB_QUERY_OUTPUT_FILTER_H_

#ifndef METRICDB_API_JSON_CODEC_H_
#define METRICDB_API_JSON_CODEC_H_

#include <optional>
#include <string>
#include <vector>

#include "metricdb/api/requests.h"
#include "metricdb/catalog/metric_catalog.h"
#include "metricdb/core/error.h"
#include "metricdb/core/result.h"
#include "metricdb/query/planner.h"

namespace metricdb {
namespace api {

/**
 * @brief Translates JSON request bodies into typed requests and responses
 *        back into JSON
 *
 * Variants are single-key objects, e.g. {"Value": 100} or
 * {"Compare": {"operation": "GreaterThan", "left": ..., "right": ...}}.
 * Malformed bodies and unknown variants fail with INVALID_ARGUMENT.
 */
class JsonCodec {
public:
    // Body of POST /metrics/{kind}: {"name": "cpu_usage"}
    static core::Result<RegisterMetricRequest> ParseRegisterMetric(const std::string& kind,
                                                                   const std::string& body);
    
    // Body of POST /metrics/auto-primary-tag/{metric}: {"key": "host"}
    static core::Result<SetAutoPrimaryTagRequest> ParseSetAutoPrimaryTag(const std::string& metric,
                                                                         const std::string& body);
    
    // Body of PUT /metrics/{kind}/{metric}: [{"time": t, "value": v, "tags": ["k:v"]}, ...]
    // Counter entries may carry "count" instead of "value".
    static core::Result<InsertBatchRequest> ParseInsertBatch(const std::string& kind,
                                                             const std::string& metric,
                                                             const std::string& body,
                                                             const std::optional<std::string>& source = std::nullopt);
    
    // Body of POST /metrics/query/{metric}
    static core::Result<LegacyQueryRequest> ParseLegacyQuery(const std::string& metric,
                                                             const std::string& body);
    
    // Body of POST /metrics/query: {"time_range": {...}, "duration": d, "expression": {...}}
    static core::Result<ExpressionQueryRequest> ParseExpressionQuery(const std::string& body);
    
    /**
     * @brief {"value": [[t, v], ...]} or, grouped, {"value": [[group, [[t, v], ...]], ...]}
     */
    static std::string FormatResponse(const query::QueryResponse& response);
    
    static std::string FormatInsertResponse(size_t num_inserted);
    static std::string FormatMetrics(const std::vector<catalog::MetricDescriptor>& metrics);
    
    // {"error": "NotFound", "message": "..."}
    static std::string FormatError(core::Error::Code code, const std::string& message);
    
    template<typename T>
    static std::string FormatError(const core::Result<T>& result) {
        return FormatError(result.code(), result.error());
    }
};

} // namespace api
} // namespace metricdb

#endif // METRICDB_API_JSON_CODEC_H_

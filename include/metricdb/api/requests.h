#ifndef METRICDB_API_REQUESTS_H_
#define METRICDB_API_REQUESTS_H_

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "metricdb/core/query_context.h"
#include "metricdb/core/types.h"
#include "metricdb/query/planner.h"

namespace metricdb {
namespace api {

struct RegisterMetricRequest {
    std::string name;
    core::MetricKind kind = core::MetricKind::GAUGE;
};

struct SetAutoPrimaryTagRequest {
    std::string metric;
    std::string key;
};

/**
 * @brief One incoming value, tags as "key:value" strings
 */
struct InsertEntry {
    core::Timestamp time = 0;
    core::Value value = 0;
    std::vector<std::string> tags;
};

struct InsertBatchRequest {
    core::MetricKind kind = core::MetricKind::GAUGE;  // Must match the registered kind
    std::string metric;
    std::vector<InsertEntry> entries;
    std::optional<std::string> source;                // Service default when absent
};

/**
 * @brief Options shared by both query flavors
 */
struct QueryOptions {
    std::optional<std::chrono::milliseconds> timeout;  // Service default when absent
    std::shared_ptr<core::CancellationToken> cancellation;
};

struct LegacyQueryRequest {
    query::LegacyQuery query;
    QueryOptions options;
};

struct ExpressionQueryRequest {
    query::ExpressionQuery query;
    QueryOptions options;
};

} // namespace api
} // namespace metricdb

#endif // METRICDB_API_REQUESTS_H_

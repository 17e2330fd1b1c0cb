#pragma once

#include <string>

namespace metricdb {
namespace core {

enum class AggregationOp {
    AVERAGE,
    SUM,
    MIN,
    MAX,
    COUNT,
    PERCENTILE
};

struct AggregationRequest {
    AggregationOp op = AggregationOp::AVERAGE;
    
    // For percentile, in [0, 100]
    double param = 0.0;
    
    static AggregationRequest Of(AggregationOp op, double param = 0.0) {
        AggregationRequest request;
        request.op = op;
        request.param = param;
        return request;
    }
    
    std::string to_string() const;
};

const char* AggregationOpName(AggregationOp op);

} // namespace core
} // namespace metricdb

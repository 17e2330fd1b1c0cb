#include "metricdb/core/aggregation.h"
#include <sstream>

namespace metricdb {
namespace core {

const char* AggregationOpName(AggregationOp op) {
    switch (op) {
        case AggregationOp::AVERAGE: return "Average";
        case AggregationOp::SUM: return "Sum";
        case AggregationOp::MIN: return "Min";
        case AggregationOp::MAX: return "Max";
        case AggregationOp::COUNT: return "Count";
        case AggregationOp::PERCENTILE: return "Percentile";
    }
    return "Unknown";
}

std::string AggregationRequest::to_string() const {
    if (op == AggregationOp::PERCENTILE) {
        std::ostringstream ss;
        ss << "Percentile(" << param << ")";
        return ss.str();
    }
    return AggregationOpName(op);
}

} // namespace core
} // namespace metricdb

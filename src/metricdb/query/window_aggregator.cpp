#include "metricdb/query/window_aggregator.h"
#include "metricdb/core/error.h"
#include <algorithm>
#include <cmath>
#include <string>

namespace metricdb {
namespace query {

namespace {

// Index of the window containing ts, corrected for floating-point rounding
// so that start + i*D <= ts < start + (i+1)*D holds exactly.
size_t WindowIndex(core::Timestamp ts, core::Timestamp start, core::Duration duration) {
    double raw = std::floor((ts - start) / duration);
    size_t index = raw > 0 ? static_cast<size_t>(raw) : 0;
    while (index > 0 && ts < start + static_cast<double>(index) * duration) {
        --index;
    }
    while (ts >= start + static_cast<double>(index + 1) * duration) {
        ++index;
    }
    return index;
}

} // namespace

WindowAggregator::WindowAggregator(const core::QueryConfig& config)
    : config_(config) {}

void WindowAggregator::Validate(const core::TimeRange& range,
                                core::Duration duration,
                                const core::AggregationRequest& aggregation) {
    if (!(duration > 0) || !std::isfinite(duration)) {
        throw core::InvalidArgumentError("Window duration must be positive, got " + std::to_string(duration));
    }
    if (!std::isfinite(range.start) || !std::isfinite(range.end)) {
        throw core::InvalidArgumentError("Time range bounds must be finite");
    }
    if (range.end < range.start) {
        throw core::InvalidArgumentError("Time range end is before start");
    }
    if (aggregation.op == core::AggregationOp::PERCENTILE &&
        !(aggregation.param >= 0.0 && aggregation.param <= 100.0)) {
        throw core::InvalidArgumentError("Percentile must be in [0, 100], got " + std::to_string(aggregation.param));
    }
}

core::Value WindowAggregator::Reduce(std::vector<core::Value>& values,
                                     const core::AggregationRequest& aggregation) {
    const size_t n = values.size();
    switch (aggregation.op) {
        case core::AggregationOp::AVERAGE: {
            double sum = 0.0;
            for (auto v : values) sum += v;
            return sum / static_cast<double>(n);
        }
        case core::AggregationOp::SUM: {
            double sum = 0.0;
            for (auto v : values) sum += v;
            return sum;
        }
        case core::AggregationOp::MIN:
            return *std::min_element(values.begin(), values.end());
        case core::AggregationOp::MAX:
            return *std::max_element(values.begin(), values.end());
        case core::AggregationOp::COUNT:
            return static_cast<double>(n);
        case core::AggregationOp::PERCENTILE: {
            // Nearest rank
            std::sort(values.begin(), values.end());
            double rank = std::ceil(aggregation.param * static_cast<double>(n) / 100.0) - 1.0;
            size_t index = 0;
            if (rank > 0) {
                index = std::min(static_cast<size_t>(rank), n - 1);
            }
            return values[index];
        }
    }
    throw core::InvalidArgumentError("Unknown aggregation operation");
}

std::vector<Bucket> WindowAggregator::aggregate(const std::vector<core::Point>& points,
                                                const core::TimeRange& range,
                                                core::Duration duration,
                                                const core::AggregationRequest& aggregation,
                                                const core::QueryContext& context) const {
    Validate(range, duration, aggregation);
    
    std::vector<Bucket> buckets;
    if (range.empty()) {
        return buckets;
    }
    
    double num_windows = std::ceil(range.length() / duration);
    if (config_.max_buckets > 0 && num_windows > static_cast<double>(config_.max_buckets)) {
        throw core::InvalidArgumentError("Query would produce " + std::to_string(num_windows) +
                                         " buckets, the limit is " + std::to_string(config_.max_buckets));
    }
    
    std::vector<core::Value> values;
    size_t current = 0;
    bool open = false;
    
    auto flush = [&]() {
        context.check();
        Bucket bucket;
        bucket.start = range.start + static_cast<double>(current) * duration;
        bucket.end = std::min(range.start + static_cast<double>(current + 1) * duration, range.end);
        bucket.count = values.size();
        bucket.value = Reduce(values, aggregation);
        buckets.push_back(bucket);
        values.clear();
    };
    
    for (const auto& point : points) {
        if (!range.contains(point.timestamp())) {
            continue;
        }
        size_t index = WindowIndex(point.timestamp(), range.start, duration);
        if (open && index != current) {
            flush();
        }
        current = index;
        open = true;
        values.push_back(point.value());
    }
    if (open) {
        flush();
    }
    
    return buckets;
}

core::Series WindowAggregator::aggregate_series(const std::vector<core::Point>& points,
                                                const core::TimeRange& range,
                                                core::Duration duration,
                                                const core::AggregationRequest& aggregation,
                                                const core::QueryContext& context) const {
    auto buckets = aggregate(points, range, duration, aggregation, context);
    core::Series series;
    series.reserve(buckets.size());
    for (const auto& bucket : buckets) {
        series.emplace_back(bucket.start, bucket.value);
    }
    return series;
}

} // namespace query
} // namespace metricdb

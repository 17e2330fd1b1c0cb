#pragma once

#include <optional>
#include <string>
#include <vector>

#include "metricdb/core/types.h"

namespace metricdb {
namespace query {

/**
 * @brief A derived series, labeled with its group key when grouped
 */
struct LabeledSeries {
    std::optional<std::string> label;
    core::Series samples;

    bool operator==(const LabeledSeries& other) const {
        return label == other.label && samples == other.samples;
    }
};

enum class ValueType {
    SCALAR,
    SERIES
};

/**
 * @brief Result of evaluating an expression node
 *
 * A scalar has no timestamps of its own and is broadcast onto the buckets of
 * the other operand. A series value is either ungrouped (exactly one series
 * without a label) or grouped (zero or more labeled series).
 */
struct Value {
    ValueType type = ValueType::SERIES;
    double scalar = 0.0;
    bool grouped = false;
    std::vector<LabeledSeries> series;

    bool isScalar() const { return type == ValueType::SCALAR; }
    bool isGrouped() const { return type == ValueType::SERIES && grouped; }

    static Value Scalar(double v) {
        Value value;
        value.type = ValueType::SCALAR;
        value.scalar = v;
        return value;
    }

    static Value Ungrouped(core::Series samples) {
        Value value;
        value.series.push_back(LabeledSeries{std::nullopt, std::move(samples)});
        return value;
    }

    static Value Grouped(std::vector<LabeledSeries> series) {
        Value value;
        value.grouped = true;
        value.series = std::move(series);
        return value;
    }
};

} // namespace query
} // namespace metricdb

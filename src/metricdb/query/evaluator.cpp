#include "metricdb/query/evaluator.h"
#include "metricdb/core/error.h"
#include "metricdb/query/output_filter.h"
#include <algorithm>
#include <cmath>
#include <set>

namespace metricdb {
namespace query {

namespace {

// One operand of a pointwise combination: a series, or a constant when series is null
struct Operand {
    const core::Series* series;
    double scalar;
};

// Inner join on timestamps. Every series is ascending with unique bucket timestamps.
core::Series Join(const std::vector<Operand>& operands, const ExpressionEvaluator::Combiner& combiner) {
    const core::Series* driver = nullptr;
    for (const auto& operand : operands) {
        if (operand.series) {
            driver = operand.series;
            break;
        }
    }
    
    core::Series result;
    if (!driver) {
        return result;
    }
    
    std::vector<size_t> cursors(operands.size(), 0);
    std::vector<double> args(operands.size(), 0.0);
    
    for (const auto& sample : *driver) {
        bool matched = true;
        for (size_t i = 0; i < operands.size(); ++i) {
            const auto& operand = operands[i];
            if (!operand.series) {
                args[i] = operand.scalar;
                continue;
            }
            const auto& series = *operand.series;
            size_t& cursor = cursors[i];
            while (cursor < series.size() && series[cursor].timestamp() < sample.timestamp()) {
                ++cursor;
            }
            if (cursor == series.size() || series[cursor].timestamp() != sample.timestamp()) {
                matched = false;
                break;
            }
            args[i] = series[cursor].value();
        }
        if (!matched) {
            continue;
        }
        auto value = combiner(args);
        if (value) {
            result.emplace_back(sample.timestamp(), *value);
        }
    }
    return result;
}

std::set<std::string> LabelSet(const Value& value) {
    std::set<std::string> labels;
    for (const auto& series : value.series) {
        labels.insert(series.label.value_or(""));
    }
    return labels;
}

std::string JoinLabels(const std::set<std::string>& labels) {
    std::string s = "{";
    bool first = true;
    for (const auto& label : labels) {
        if (!first) s += ", ";
        s += label;
        first = false;
    }
    return s + "}";
}

void CollectMetrics(const ExprNode* node, std::vector<std::string>& metrics) {
    if (!node) {
        return;
    }
    switch (node->type()) {
        case ExprNode::Type::METRIC_REF: {
            const auto& metric = static_cast<const MetricRefNode*>(node)->metric;
            if (std::find(metrics.begin(), metrics.end(), metric) == metrics.end()) {
                metrics.push_back(metric);
            }
            return;
        }
        case ExprNode::Type::VALUE:
            return;
        case ExprNode::Type::ARITHMETIC: {
            const auto* arithmetic = static_cast<const ArithmeticNode*>(node);
            CollectMetrics(arithmetic->lhs.get(), metrics);
            CollectMetrics(arithmetic->rhs.get(), metrics);
            return;
        }
        case ExprNode::Type::FUNCTION:
            for (const auto& arg : static_cast<const FunctionNode*>(node)->args) {
                CollectMetrics(arg.get(), metrics);
            }
            return;
    }
}

} // namespace

ExpressionEvaluator::ExpressionEvaluator(const storage::PointStore* store,
                                         const GroupPartitioner* partitioner,
                                         const WindowAggregator* aggregator,
                                         const core::TimeRange& range,
                                         core::Duration duration,
                                         const core::QueryContext* context)
    : store_(store),
      partitioner_(partitioner),
      aggregator_(aggregator),
      range_(range),
      duration_(duration),
      context_(context) {
    if (!store_ || !partitioner_ || !aggregator_ || !context_) {
        throw core::InvalidArgumentError("ExpressionEvaluator requires a store, partitioner, aggregator and context");
    }
}

void ExpressionEvaluator::Validate(const ExprNode* node) {
    if (!node) {
        throw core::InvalidArgumentError("Expression is missing");
    }
    switch (node->type()) {
        case ExprNode::Type::METRIC_REF: {
            const auto* ref = static_cast<const MetricRefNode*>(node);
            if (ref->metric.empty()) {
                throw core::InvalidArgumentError("Metric reference has an empty name");
            }
            if (ref->aggregation.op == core::AggregationOp::PERCENTILE &&
                !(ref->aggregation.param >= 0.0 && ref->aggregation.param <= 100.0)) {
                throw core::InvalidArgumentError("Percentile must be in [0, 100], got " +
                                                 std::to_string(ref->aggregation.param));
            }
            if (ref->query.group_by && ref->query.group_by->empty()) {
                throw core::InvalidArgumentError("group_by key of '" + ref->metric + "' is empty");
            }
            OutputFilter::ValidateTransform(ref->query.output_transform.get());
            OutputFilter::Validate(ref->query.output_filter.get());
            return;
        }
        case ExprNode::Type::VALUE:
            return;
        case ExprNode::Type::ARITHMETIC: {
            const auto* arithmetic = static_cast<const ArithmeticNode*>(node);
            Validate(arithmetic->lhs.get());
            Validate(arithmetic->rhs.get());
            return;
        }
        case ExprNode::Type::FUNCTION: {
            const auto* call = static_cast<const FunctionNode*>(node);
            if (call->args.size() != FunctionArity(call->function)) {
                throw core::InvalidArgumentError(std::string("Function ") + FunctionName(call->function) +
                    " expects " + std::to_string(FunctionArity(call->function)) + " arguments, got " +
                    std::to_string(call->args.size()));
            }
            for (const auto& arg : call->args) {
                Validate(arg.get());
            }
            return;
        }
    }
    throw core::InvalidArgumentError("Unknown expression node type");
}

std::vector<std::string> ExpressionEvaluator::ReferencedMetrics(const ExprNode* node) {
    std::vector<std::string> metrics;
    CollectMetrics(node, metrics);
    return metrics;
}

Value ExpressionEvaluator::AggregateMetric(const std::string& metric,
                                           const core::AggregationRequest& aggregation,
                                           const std::optional<std::string>& group_by,
                                           const std::vector<core::Tag>& tags) {
    auto scanned = store_->scan(metric, range_, tags, *context_);
    if (!scanned.ok()) {
        throw core::Error(scanned.error(), scanned.code());
    }
    points_scanned_ += scanned.value().size();
    
    auto groups = partitioner_->partition(scanned.take_value(), group_by);
    if (!group_by) {
        return Value::Ungrouped(aggregator_->aggregate_series(
            groups.front().points, range_, duration_, aggregation, *context_));
    }
    
    std::vector<LabeledSeries> series;
    series.reserve(groups.size());
    for (const auto& group : groups) {
        series.push_back(LabeledSeries{
            group.label,
            aggregator_->aggregate_series(group.points, range_, duration_, aggregation, *context_)});
    }
    return Value::Grouped(std::move(series));
}

void ExpressionEvaluator::Prepare(const ExprNode* root) {
    if (!root) {
        return;
    }
    switch (root->type()) {
        case ExprNode::Type::METRIC_REF: {
            const auto* ref = static_cast<const MetricRefNode*>(root);
            if (prepared_.find(ref) == prepared_.end()) {
                prepared_.emplace(ref, AggregateMetric(ref->metric, ref->aggregation,
                                                       ref->query.group_by, ref->query.tags));
            }
            return;
        }
        case ExprNode::Type::VALUE:
            return;
        case ExprNode::Type::ARITHMETIC: {
            const auto* arithmetic = static_cast<const ArithmeticNode*>(root);
            Prepare(arithmetic->lhs.get());
            Prepare(arithmetic->rhs.get());
            return;
        }
        case ExprNode::Type::FUNCTION:
            for (const auto& arg : static_cast<const FunctionNode*>(root)->args) {
                Prepare(arg.get());
            }
            return;
    }
    throw core::InvalidArgumentError("Unknown expression node type");
}

Value ExpressionEvaluator::Evaluate(const ExprNode* node) {
    if (!node) {
        throw core::InvalidArgumentError("Expression is missing");
    }
    
    switch (node->type()) {
        case ExprNode::Type::METRIC_REF:
            return EvaluateMetricRef(static_cast<const MetricRefNode*>(node));
        case ExprNode::Type::VALUE:
            return EvaluateValue(static_cast<const ValueNode*>(node));
        case ExprNode::Type::ARITHMETIC:
            return EvaluateArithmetic(static_cast<const ArithmeticNode*>(node));
        case ExprNode::Type::FUNCTION:
            return EvaluateFunction(static_cast<const FunctionNode*>(node));
    }
    throw core::InvalidArgumentError("Unknown expression node type");
}

Value ExpressionEvaluator::EvaluateMetricRef(const MetricRefNode* node) {
    Value value;
    auto it = prepared_.find(node);
    if (it != prepared_.end()) {
        value = std::move(it->second);
        prepared_.erase(it);
    } else {
        value = AggregateMetric(node->metric, node->aggregation, node->query.group_by, node->query.tags);
    }
    
    OutputFilter::Transform(node->query.output_transform.get(), value.series);
    OutputFilter::Apply(node->query.output_filter.get(), value.series);
    return value;
}

Value ExpressionEvaluator::EvaluateValue(const ValueNode* node) {
    return Value::Scalar(node->value);
}

Value ExpressionEvaluator::EvaluateArithmetic(const ArithmeticNode* node) {
    std::vector<Value> operands;
    operands.push_back(Evaluate(node->lhs.get()));
    operands.push_back(Evaluate(node->rhs.get()));
    
    const ArithmeticOp op = node->op;
    return Combine(operands, [op](const std::vector<double>& args) {
        return ApplyArithmetic(op, args[0], args[1]);
    }, *context_);
}

Value ExpressionEvaluator::EvaluateFunction(const FunctionNode* node) {
    if (node->args.size() != FunctionArity(node->function)) {
        throw core::InvalidArgumentError(std::string("Function ") + FunctionName(node->function) +
            " expects " + std::to_string(FunctionArity(node->function)) + " arguments, got " +
            std::to_string(node->args.size()));
    }
    
    std::vector<Value> operands;
    operands.reserve(node->args.size());
    for (const auto& arg : node->args) {
        operands.push_back(Evaluate(arg.get()));
    }
    
    const Function function = node->function;
    return Combine(operands, [function](const std::vector<double>& args) {
        return ApplyFunction(function, args);
    }, *context_);
}

Value ExpressionEvaluator::Combine(const std::vector<Value>& operands,
                                   const Combiner& combiner,
                                   const core::QueryContext& context) {
    bool all_scalar = std::all_of(operands.begin(), operands.end(),
                                  [](const Value& v) { return v.isScalar(); });
    if (all_scalar) {
        std::vector<double> args;
        args.reserve(operands.size());
        for (const auto& operand : operands) {
            args.push_back(operand.scalar);
        }
        auto result = combiner(args);
        if (!result) {
            // An undefined constant removes every bucket it is combined with
            return Value::Ungrouped(core::Series());
        }
        return Value::Scalar(*result);
    }
    
    const Value* first_grouped = nullptr;
    std::set<std::string> labels;
    for (const auto& operand : operands) {
        if (!operand.isGrouped()) {
            continue;
        }
        if (!first_grouped) {
            first_grouped = &operand;
            labels = LabelSet(operand);
            continue;
        }
        auto other = LabelSet(operand);
        if (other != labels) {
            throw core::InvalidArgumentError("Grouped operands have different groups: " +
                                             JoinLabels(labels) + " vs " + JoinLabels(other));
        }
    }
    
    auto operand_for = [](const Value& value, const std::string* label) {
        if (value.isScalar()) {
            return Operand{nullptr, value.scalar};
        }
        if (!value.grouped || !label) {
            return Operand{&value.series.front().samples, 0.0};
        }
        for (const auto& series : value.series) {
            if (series.label.value_or("") == *label) {
                return Operand{&series.samples, 0.0};
            }
        }
        throw core::InternalError("Group '" + *label + "' vanished during alignment");
    };
    
    if (!first_grouped) {
        std::vector<Operand> aligned;
        for (const auto& operand : operands) {
            aligned.push_back(operand_for(operand, nullptr));
        }
        context.check();
        return Value::Ungrouped(Join(aligned, combiner));
    }
    
    std::vector<LabeledSeries> result;
    result.reserve(first_grouped->series.size());
    for (const auto& group : first_grouped->series) {
        context.check();
        const std::string label = group.label.value_or("");
        std::vector<Operand> aligned;
        for (const auto& operand : operands) {
            aligned.push_back(operand_for(operand, &label));
        }
        result.push_back(LabeledSeries{group.label, Join(aligned, combiner)});
    }
    return Value::Grouped(std::move(result));
}

} // namespace query
} // namespace metricdb

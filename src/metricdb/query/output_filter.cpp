#include "metricdb/query/output_filter.h"
#include "metricdb/core/error.h"
#include <string>

namespace metricdb {
namespace query {

void OutputFilter::ValidateNode(const TransformNode* node) {
    if (!node) {
        throw core::InvalidArgumentError("Transform is missing");
    }
    switch (node->type()) {
        case TransformNode::Type::INPUT_VALUE:
        case TransformNode::Type::VALUE:
            return;
        case TransformNode::Type::ARITHMETIC: {
            const auto* arithmetic = static_cast<const ArithmeticTransform*>(node);
            ValidateNode(arithmetic->lhs.get());
            ValidateNode(arithmetic->rhs.get());
            return;
        }
        case TransformNode::Type::FUNCTION: {
            const auto* call = static_cast<const FunctionTransform*>(node);
            if (call->args.size() != FunctionArity(call->function)) {
                throw core::InvalidArgumentError(std::string("Function ") + FunctionName(call->function) +
                    " expects " + std::to_string(FunctionArity(call->function)) + " arguments, got " +
                    std::to_string(call->args.size()));
            }
            for (const auto& arg : call->args) {
                ValidateNode(arg.get());
            }
            return;
        }
    }
    throw core::InvalidArgumentError("Unknown output filter transform");
}

void OutputFilter::ValidateTransform(const TransformNode* transform) {
    if (transform) {
        ValidateNode(transform);
    }
}

void OutputFilter::Validate(const FilterNode* filter) {
    if (!filter) {
        return;
    }
    switch (filter->type()) {
        case FilterNode::Type::COMPARE: {
            const auto* compare = static_cast<const CompareFilter*>(filter);
            ValidateNode(compare->lhs.get());
            ValidateNode(compare->rhs.get());
            return;
        }
        case FilterNode::Type::AND: {
            const auto* node = static_cast<const AndFilter*>(filter);
            if (!node->lhs || !node->rhs) {
                throw core::InvalidArgumentError("And filter requires two operands");
            }
            Validate(node->lhs.get());
            Validate(node->rhs.get());
            return;
        }
        case FilterNode::Type::OR: {
            const auto* node = static_cast<const OrFilter*>(filter);
            if (!node->lhs || !node->rhs) {
                throw core::InvalidArgumentError("Or filter requires two operands");
            }
            Validate(node->lhs.get());
            Validate(node->rhs.get());
            return;
        }
    }
    throw core::InvalidArgumentError("Unknown output filter");
}

std::optional<double> OutputFilter::EvaluateTransform(const TransformNode* node, double input) {
    switch (node->type()) {
        case TransformNode::Type::INPUT_VALUE:
            return input;
        case TransformNode::Type::VALUE:
            return static_cast<const ValueTransform*>(node)->value;
        case TransformNode::Type::ARITHMETIC: {
            const auto* arithmetic = static_cast<const ArithmeticTransform*>(node);
            auto left = EvaluateTransform(arithmetic->lhs.get(), input);
            auto right = EvaluateTransform(arithmetic->rhs.get(), input);
            if (!left || !right) {
                return std::nullopt;
            }
            return ApplyArithmetic(arithmetic->op, *left, *right);
        }
        case TransformNode::Type::FUNCTION: {
            const auto* call = static_cast<const FunctionTransform*>(node);
            std::vector<double> arguments;
            arguments.reserve(call->args.size());
            for (const auto& arg : call->args) {
                auto value = EvaluateTransform(arg.get(), input);
                if (!value) {
                    return std::nullopt;
                }
                arguments.push_back(*value);
            }
            return ApplyFunction(call->function, arguments);
        }
    }
    throw core::InvalidArgumentError("Unknown output filter transform");
}

bool OutputFilter::Matches(const FilterNode* filter, double input) {
    if (!filter) {
        return true;
    }
    switch (filter->type()) {
        case FilterNode::Type::COMPARE: {
            const auto* compare = static_cast<const CompareFilter*>(filter);
            auto left = EvaluateTransform(compare->lhs.get(), input);
            auto right = EvaluateTransform(compare->rhs.get(), input);
            if (!left || !right) {
                return false;
            }
            return ApplyCompare(compare->op, *left, *right);
        }
        case FilterNode::Type::AND: {
            const auto* node = static_cast<const AndFilter*>(filter);
            return Matches(node->lhs.get(), input) && Matches(node->rhs.get(), input);
        }
        case FilterNode::Type::OR: {
            const auto* node = static_cast<const OrFilter*>(filter);
            return Matches(node->lhs.get(), input) || Matches(node->rhs.get(), input);
        }
    }
    throw core::InvalidArgumentError("Unknown output filter");
}

core::Series OutputFilter::Apply(const FilterNode* filter, const core::Series& samples) {
    if (!filter) {
        return samples;
    }
    core::Series result;
    result.reserve(samples.size());
    for (const auto& sample : samples) {
        if (Matches(filter, sample.value())) {
            result.push_back(sample);
        }
    }
    return result;
}

void OutputFilter::Apply(const FilterNode* filter, std::vector<LabeledSeries>& series) {
    if (!filter) {
        return;
    }
    for (auto& entry : series) {
        entry.samples = Apply(filter, entry.samples);
    }
}

core::Series OutputFilter::Transform(const TransformNode* transform, const core::Series& samples) {
    if (!transform) {
        return samples;
    }
    core::Series result;
    result.reserve(samples.size());
    for (const auto& sample : samples) {
        auto value = EvaluateTransform(transform, sample.value());
        if (value) {
            result.emplace_back(sample.timestamp(), *value);
        }
    }
    return result;
}

void OutputFilter::Transform(const TransformNode* transform, std::vector<LabeledSeries>& series) {
    if (!transform) {
        return;
    }
    for (auto& entry : series) {
        entry.samples = Transform(transform, entry.samples);
    }
}

} // namespace query
} // namespace metricdb

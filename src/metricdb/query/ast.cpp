#include "metricdb/query/ast.h"
#include <cmath>
#include <sstream>

namespace metricdb {
namespace query {

namespace {

struct FunctionInfo {
    Function function;
    const char* name;
    size_t arity;
};

const FunctionInfo kFunctions[] = {
    {Function::ABS, "Abs", 1},
    {Function::MAX, "Max", 2},
    {Function::MIN, "Min", 2},
    {Function::ROUND, "Round", 1},
    {Function::CEIL, "Ceil", 1},
    {Function::FLOOR, "Floor", 1},
    {Function::SQRT, "Sqrt", 1},
    {Function::SQUARE, "Square", 1},
    {Function::POWER, "Power", 2},
    {Function::EXPONENTIAL, "Exponential", 1},
    {Function::LOG_E, "LogE", 1},
    {Function::LOG_BASE, "LogBase", 2},
    {Function::SIN, "Sin", 1},
    {Function::COS, "Cos", 1},
    {Function::TAN, "Tan", 1},
};

const FunctionInfo* FindFunction(Function function) {
    for (const auto& info : kFunctions) {
        if (info.function == function) {
            return &info;
        }
    }
    return nullptr;
}

template<typename Args>
std::string JoinArgs(const Args& args) {
    std::string s;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) s += ", ";
        s += args[i] ? args[i]->String() : "<null>";
    }
    return s;
}

std::string Child(const TransformNode* node) { return node ? node->String() : "<null>"; }
std::string Child(const FilterNode* node) { return node ? node->String() : "<null>"; }
std::string Child(const ExprNode* node) { return node ? node->String() : "<null>"; }

} // namespace

const char* ArithmeticOpName(ArithmeticOp op) {
    switch (op) {
        case ArithmeticOp::ADD: return "Add";
        case ArithmeticOp::SUBTRACT: return "Subtract";
        case ArithmeticOp::MULTIPLY: return "Multiply";
        case ArithmeticOp::DIVIDE: return "Divide";
    }
    return "Unknown";
}

const char* CompareOpName(CompareOp op) {
    switch (op) {
        case CompareOp::EQUAL: return "Equal";
        case CompareOp::NOT_EQUAL: return "NotEqual";
        case CompareOp::GREATER_THAN: return "GreaterThan";
        case CompareOp::GREATER_THAN_OR_EQUAL: return "GreaterThanOrEqual";
        case CompareOp::LESS_THAN: return "LessThan";
        case CompareOp::LESS_THAN_OR_EQUAL: return "LessThanOrEqual";
    }
    return "Unknown";
}

const char* FunctionName(Function function) {
    const auto* info = FindFunction(function);
    return info ? info->name : "Unknown";
}

std::optional<ArithmeticOp> ParseArithmeticOp(const std::string& name) {
    if (name == "Add") return ArithmeticOp::ADD;
    if (name == "Subtract") return ArithmeticOp::SUBTRACT;
    if (name == "Multiply") return ArithmeticOp::MULTIPLY;
    if (name == "Divide") return ArithmeticOp::DIVIDE;
    return std::nullopt;
}

std::optional<CompareOp> ParseCompareOp(const std::string& name) {
    if (name == "Equal") return CompareOp::EQUAL;
    if (name == "NotEqual") return CompareOp::NOT_EQUAL;
    if (name == "GreaterThan") return CompareOp::GREATER_THAN;
    if (name == "GreaterThanOrEqual") return CompareOp::GREATER_THAN_OR_EQUAL;
    if (name == "LessThan") return CompareOp::LESS_THAN;
    if (name == "LessThanOrEqual") return CompareOp::LESS_THAN_OR_EQUAL;
    return std::nullopt;
}

std::optional<Function> ParseFunction(const std::string& name) {
    for (const auto& info : kFunctions) {
        if (name == info.name) {
            return info.function;
        }
    }
    return std::nullopt;
}

size_t FunctionArity(Function function) {
    const auto* info = FindFunction(function);
    return info ? info->arity : 0;
}

std::optional<double> ApplyArithmetic(ArithmeticOp op, double left, double right) {
    switch (op) {
        case ArithmeticOp::ADD: return left + right;
        case ArithmeticOp::SUBTRACT: return left - right;
        case ArithmeticOp::MULTIPLY: return left * right;
        case ArithmeticOp::DIVIDE:
            if (right == 0.0) {
                return std::nullopt;
            }
            return left / right;
    }
    return std::nullopt;
}

std::optional<double> ApplyFunction(Function function, const std::vector<double>& arguments) {
    if (arguments.size() != FunctionArity(function)) {
        return std::nullopt;
    }
    
    double result = 0.0;
    switch (function) {
        case Function::ABS: result = std::fabs(arguments[0]); break;
        case Function::MAX: result = std::fmax(arguments[0], arguments[1]); break;
        case Function::MIN: result = std::fmin(arguments[0], arguments[1]); break;
        case Function::ROUND: result = std::round(arguments[0]); break;
        case Function::CEIL: result = std::ceil(arguments[0]); break;
        case Function::FLOOR: result = std::floor(arguments[0]); break;
        case Function::SQRT:
            if (arguments[0] < 0.0) return std::nullopt;
            result = std::sqrt(arguments[0]);
            break;
        case Function::SQUARE: result = arguments[0] * arguments[0]; break;
        case Function::POWER: result = std::pow(arguments[0], arguments[1]); break;
        case Function::EXPONENTIAL: result = std::exp(arguments[0]); break;
        case Function::LOG_E:
            if (arguments[0] <= 0.0) return std::nullopt;
            result = std::log(arguments[0]);
            break;
        case Function::LOG_BASE:
            // log of arguments[0] in base arguments[1]
            if (arguments[0] <= 0.0 || arguments[1] <= 0.0 || arguments[1] == 1.0) return std::nullopt;
            result = std::log(arguments[0]) / std::log(arguments[1]);
            break;
        case Function::SIN: result = std::sin(arguments[0]); break;
        case Function::COS: result = std::cos(arguments[0]); break;
        case Function::TAN: result = std::tan(arguments[0]); break;
    }
    
    if (!std::isfinite(result)) {
        return std::nullopt;
    }
    return result;
}

bool ApplyCompare(CompareOp op, double left, double right) {
    switch (op) {
        case CompareOp::EQUAL: return left == right;
        case CompareOp::NOT_EQUAL: return left != right;
        case CompareOp::GREATER_THAN: return left > right;
        case CompareOp::GREATER_THAN_OR_EQUAL: return left >= right;
        case CompareOp::LESS_THAN: return left < right;
        case CompareOp::LESS_THAN_OR_EQUAL: return left <= right;
    }
    return false;
}

std::string InputValueTransform::String() const {
    return "InputValue";
}

std::string ValueTransform::String() const {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

std::string ArithmeticTransform::String() const {
    return std::string(ArithmeticOpName(op)) + "(" + Child(lhs.get()) + ", " + Child(rhs.get()) + ")";
}

std::string FunctionTransform::String() const {
    return std::string(FunctionName(function)) + "(" + JoinArgs(args) + ")";
}

std::string CompareFilter::String() const {
    return std::string(CompareOpName(op)) + "(" + Child(lhs.get()) + ", " + Child(rhs.get()) + ")";
}

std::string AndFilter::String() const {
    return "And(" + Child(lhs.get()) + ", " + Child(rhs.get()) + ")";
}

std::string OrFilter::String() const {
    return "Or(" + Child(lhs.get()) + ", " + Child(rhs.get()) + ")";
}

std::string MetricRefNode::String() const {
    std::string s = aggregation.to_string() + "(" + metric;
    if (query.group_by) {
        s += " by " + *query.group_by;
    }
    for (const auto& tag : query.tags) {
        s += " " + tag.to_string();
    }
    if (query.output_transform) {
        s += " map " + query.output_transform->String();
    }
    if (query.output_filter) {
        s += " where " + query.output_filter->String();
    }
    return s + ")";
}

std::string ValueNode::String() const {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

std::string ArithmeticNode::String() const {
    return std::string(ArithmeticOpName(op)) + "(" + Child(lhs.get()) + ", " + Child(rhs.get()) + ")";
}

std::string FunctionNode::String() const {
    return std::string(FunctionName(function)) + "(" + JoinArgs(args) + ")";
}

} // namespace query
} // namespace metricdb

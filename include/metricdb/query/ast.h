#ifndef METRICDB_QUERY_AST_H_
#define METRICDB_QUERY_AST_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "metricdb/core/aggregation.h"
#include "metricdb/core/types.h"

namespace metricdb {
namespace query {

enum class ArithmeticOp {
    ADD,
    SUBTRACT,
    MULTIPLY,
    DIVIDE
};

enum class CompareOp {
    EQUAL,
    NOT_EQUAL,
    GREATER_THAN,
    GREATER_THAN_OR_EQUAL,
    LESS_THAN,
    LESS_THAN_OR_EQUAL
};

enum class Function {
    ABS,
    MAX,
    MIN,
    ROUND,
    CEIL,
    FLOOR,
    SQRT,
    SQUARE,
    POWER,
    EXPONENTIAL,
    LOG_E,
    LOG_BASE,
    SIN,
    COS,
    TAN
};

const char* ArithmeticOpName(ArithmeticOp op);
const char* CompareOpName(CompareOp op);
const char* FunctionName(Function function);

std::optional<ArithmeticOp> ParseArithmeticOp(const std::string& name);
std::optional<CompareOp> ParseCompareOp(const std::string& name);
std::optional<Function> ParseFunction(const std::string& name);

size_t FunctionArity(Function function);

// Division by zero yields no value
std::optional<double> ApplyArithmetic(ArithmeticOp op, double left, double right);

// No value outside the function's domain (sqrt of a negative, log of a non-positive)
// or on an arity mismatch
std::optional<double> ApplyFunction(Function function, const std::vector<double>& arguments);

bool ApplyCompare(CompareOp op, double left, double right);

// ---------------------------------------------------------------------------
// Output filter trees
// ---------------------------------------------------------------------------

// Per-point value computation used on each side of a comparison
struct TransformNode {
    enum class Type {
        INPUT_VALUE,
        VALUE,
        ARITHMETIC,
        FUNCTION
    };

    virtual ~TransformNode() = default;
    virtual Type type() const = 0;
    virtual std::string String() const = 0;
};

struct InputValueTransform : TransformNode {
    Type type() const override { return Type::INPUT_VALUE; }
    std::string String() const override;
};

struct ValueTransform : TransformNode {
    double value;
    explicit ValueTransform(double v) : value(v) {}
    Type type() const override { return Type::VALUE; }
    std::string String() const override;
};

struct ArithmeticTransform : TransformNode {
    ArithmeticOp op;
    std::unique_ptr<TransformNode> lhs;
    std::unique_ptr<TransformNode> rhs;

    ArithmeticTransform(ArithmeticOp o, std::unique_ptr<TransformNode> l, std::unique_ptr<TransformNode> r)
        : op(o), lhs(std::move(l)), rhs(std::move(r)) {}
    Type type() const override { return Type::ARITHMETIC; }
    std::string String() const override;
};

struct FunctionTransform : TransformNode {
    Function function;
    std::vector<std::unique_ptr<TransformNode>> args;

    FunctionTransform(Function f, std::vector<std::unique_ptr<TransformNode>> a)
        : function(f), args(std::move(a)) {}
    Type type() const override { return Type::FUNCTION; }
    std::string String() const override;
};

// Predicate deciding whether an output point is kept
struct FilterNode {
    enum class Type {
        COMPARE,
        AND,
        OR
    };

    virtual ~FilterNode() = default;
    virtual Type type() const = 0;
    virtual std::string String() const = 0;
};

struct CompareFilter : FilterNode {
    CompareOp op;
    std::unique_ptr<TransformNode> lhs;
    std::unique_ptr<TransformNode> rhs;

    CompareFilter(CompareOp o, std::unique_ptr<TransformNode> l, std::unique_ptr<TransformNode> r)
        : op(o), lhs(std::move(l)), rhs(std::move(r)) {}
    Type type() const override { return Type::COMPARE; }
    std::string String() const override;
};

struct AndFilter : FilterNode {
    std::unique_ptr<FilterNode> lhs;
    std::unique_ptr<FilterNode> rhs;

    AndFilter(std::unique_ptr<FilterNode> l, std::unique_ptr<FilterNode> r)
        : lhs(std::move(l)), rhs(std::move(r)) {}
    Type type() const override { return Type::AND; }
    std::string String() const override;
};

struct OrFilter : FilterNode {
    std::unique_ptr<FilterNode> lhs;
    std::unique_ptr<FilterNode> rhs;

    OrFilter(std::unique_ptr<FilterNode> l, std::unique_ptr<FilterNode> r)
        : lhs(std::move(l)), rhs(std::move(r)) {}
    Type type() const override { return Type::OR; }
    std::string String() const override;
};

// ---------------------------------------------------------------------------
// Query and expression trees
// ---------------------------------------------------------------------------

/**
 * @brief Per-metric selection: grouping, exact tag filter (AND), output
 * transform and output filter
 *
 * The transform maps every aggregated value before the filter sees it.
 */
struct MetricQuery {
    std::optional<std::string> group_by;
    std::vector<core::Tag> tags;
    std::unique_ptr<TransformNode> output_transform;
    std::unique_ptr<FilterNode> output_filter;
};

struct ExprNode {
    enum class Type {
        METRIC_REF,
        VALUE,
        ARITHMETIC,
        FUNCTION
    };

    virtual ~ExprNode() = default;
    virtual Type type() const = 0;
    virtual std::string String() const = 0;
};

// An aggregated metric, e.g. Average(cpu_usage by host)
struct MetricRefNode : ExprNode {
    std::string metric;
    core::AggregationRequest aggregation;
    MetricQuery query;

    MetricRefNode(std::string m, core::AggregationRequest a, MetricQuery q)
        : metric(std::move(m)), aggregation(a), query(std::move(q)) {}
    Type type() const override { return Type::METRIC_REF; }
    std::string String() const override;
};

// A constant broadcast to the bucket timestamps of the rest of the tree
struct ValueNode : ExprNode {
    double value;
    explicit ValueNode(double v) : value(v) {}
    Type type() const override { return Type::VALUE; }
    std::string String() const override;
};

struct ArithmeticNode : ExprNode {
    ArithmeticOp op;
    std::unique_ptr<ExprNode> lhs;
    std::unique_ptr<ExprNode> rhs;

    ArithmeticNode(ArithmeticOp o, std::unique_ptr<ExprNode> l, std::unique_ptr<ExprNode> r)
        : op(o), lhs(std::move(l)), rhs(std::move(r)) {}
    Type type() const override { return Type::ARITHMETIC; }
    std::string String() const override;
};

struct FunctionNode : ExprNode {
    Function function;
    std::vector<std::unique_ptr<ExprNode>> args;

    FunctionNode(Function f, std::vector<std::unique_ptr<ExprNode>> a)
        : function(f), args(std::move(a)) {}
    Type type() const override { return Type::FUNCTION; }
    std::string String() const override;
};

} // namespace query
} // namespace metricdb

#endif // METRICDB_QUERY_AST_H_

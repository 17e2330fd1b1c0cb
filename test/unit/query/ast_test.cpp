#include <gtest/gtest.h>
#include "metricdb/query/ast.h"
#include <cmath>

namespace metricdb {
namespace query {
namespace {

TEST(AstTest, ArithmeticDivideByZeroHasNoValue) {
    EXPECT_DOUBLE_EQ(*ApplyArithmetic(ArithmeticOp::ADD, 2, 3), 5);
    EXPECT_DOUBLE_EQ(*ApplyArithmetic(ArithmeticOp::SUBTRACT, 2, 3), -1);
    EXPECT_DOUBLE_EQ(*ApplyArithmetic(ArithmeticOp::MULTIPLY, 2, 3), 6);
    EXPECT_DOUBLE_EQ(*ApplyArithmetic(ArithmeticOp::DIVIDE, 3, 2), 1.5);
    EXPECT_FALSE(ApplyArithmetic(ArithmeticOp::DIVIDE, 3, 0).has_value());
}

TEST(AstTest, FunctionValues) {
    EXPECT_DOUBLE_EQ(*ApplyFunction(Function::ABS, {-2.5}), 2.5);
    EXPECT_DOUBLE_EQ(*ApplyFunction(Function::MAX, {1, 4}), 4);
    EXPECT_DOUBLE_EQ(*ApplyFunction(Function::MIN, {1, 4}), 1);
    EXPECT_DOUBLE_EQ(*ApplyFunction(Function::ROUND, {2.5}), 3);
    EXPECT_DOUBLE_EQ(*ApplyFunction(Function::CEIL, {2.1}), 3);
    EXPECT_DOUBLE_EQ(*ApplyFunction(Function::FLOOR, {2.9}), 2);
    EXPECT_DOUBLE_EQ(*ApplyFunction(Function::SQRT, {16}), 4);
    EXPECT_DOUBLE_EQ(*ApplyFunction(Function::SQUARE, {3}), 9);
    EXPECT_DOUBLE_EQ(*ApplyFunction(Function::POWER, {2, 10}), 1024);
    EXPECT_DOUBLE_EQ(*ApplyFunction(Function::EXPONENTIAL, {0}), 1);
    EXPECT_DOUBLE_EQ(*ApplyFunction(Function::LOG_E, {std::exp(2.0)}), 2);
    EXPECT_DOUBLE_EQ(*ApplyFunction(Function::LOG_BASE, {8, 2}), 3);
    EXPECT_DOUBLE_EQ(*ApplyFunction(Function::SIN, {0}), 0);
    EXPECT_DOUBLE_EQ(*ApplyFunction(Function::COS, {0}), 1);
    EXPECT_DOUBLE_EQ(*ApplyFunction(Function::TAN, {0}), 0);
}

TEST(AstTest, FunctionOutsideDomainHasNoValue) {
    EXPECT_FALSE(ApplyFunction(Function::SQRT, {-1}).has_value());
    EXPECT_FALSE(ApplyFunction(Function::LOG_E, {0}).has_value());
    EXPECT_FALSE(ApplyFunction(Function::LOG_BASE, {8, 1}).has_value());
    EXPECT_FALSE(ApplyFunction(Function::EXPONENTIAL, {1e6}).has_value());
}

TEST(AstTest, FunctionArityMismatchHasNoValue) {
    EXPECT_FALSE(ApplyFunction(Function::ABS, {1, 2}).has_value());
    EXPECT_FALSE(ApplyFunction(Function::POWER, {2}).has_value());
    EXPECT_EQ(FunctionArity(Function::ABS), 1);
    EXPECT_EQ(FunctionArity(Function::LOG_BASE), 2);
}

TEST(AstTest, CompareOperations) {
    EXPECT_TRUE(ApplyCompare(CompareOp::EQUAL, 1, 1));
    EXPECT_TRUE(ApplyCompare(CompareOp::NOT_EQUAL, 1, 2));
    EXPECT_TRUE(ApplyCompare(CompareOp::GREATER_THAN, 2, 1));
    EXPECT_FALSE(ApplyCompare(CompareOp::GREATER_THAN, 1, 1));
    EXPECT_TRUE(ApplyCompare(CompareOp::GREATER_THAN_OR_EQUAL, 1, 1));
    EXPECT_TRUE(ApplyCompare(CompareOp::LESS_THAN, 1, 2));
    EXPECT_FALSE(ApplyCompare(CompareOp::LESS_THAN, 2, 1));
    EXPECT_TRUE(ApplyCompare(CompareOp::LESS_THAN_OR_EQUAL, 2, 2));
}

TEST(AstTest, NamesRoundTrip) {
    for (auto op : {ArithmeticOp::ADD, ArithmeticOp::SUBTRACT, ArithmeticOp::MULTIPLY, ArithmeticOp::DIVIDE}) {
        EXPECT_EQ(ParseArithmeticOp(ArithmeticOpName(op)), op);
    }
    for (auto op : {CompareOp::EQUAL, CompareOp::NOT_EQUAL, CompareOp::GREATER_THAN,
                    CompareOp::GREATER_THAN_OR_EQUAL, CompareOp::LESS_THAN, CompareOp::LESS_THAN_OR_EQUAL}) {
        EXPECT_EQ(ParseCompareOp(CompareOpName(op)), op);
    }
    EXPECT_EQ(ParseFunction("LogBase"), Function::LOG_BASE);
    EXPECT_EQ(ParseFunction("Sqrt"), Function::SQRT);
    EXPECT_FALSE(ParseFunction("Median").has_value());
    EXPECT_FALSE(ParseArithmeticOp("Modulo").has_value());
}

TEST(AstTest, ExpressionString) {
    MetricQuery query;
    query.group_by = "host";
    auto ref = std::make_unique<MetricRefNode>(
        "used_memory", core::AggregationRequest::Of(core::AggregationOp::AVERAGE), std::move(query));
    ArithmeticNode node(ArithmeticOp::DIVIDE, std::move(ref), std::make_unique<ValueNode>(100));
    
    EXPECT_EQ(node.String(), "Divide(Average(used_memory by host), 100)");
}

TEST(AstTest, FilterString) {
    CompareFilter filter(CompareOp::GREATER_THAN,
                         std::make_unique<InputValueTransform>(),
                         std::make_unique<ValueTransform>(0.1));
    EXPECT_EQ(filter.String(), "GreaterThan(InputValue, 0.1)");
}

} // namespace
} // namespace query
} // namespace metricdb

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "metricdb/query/evaluator.h"
#include "metricdb/core/error.h"

namespace metricdb {
namespace query {
namespace {

using core::AggregationOp;
using core::AggregationRequest;
using core::MetricKind;
using core::Point;
using core::Tags;
using core::TimeRange;
using ::testing::ElementsAre;

core::Series MakeSeries(const std::vector<std::pair<double, double>>& samples) {
    core::Series series;
    for (const auto& [ts, value] : samples) {
        series.emplace_back(ts, value);
    }
    return series;
}

std::unique_ptr<ExprNode> Ref(const std::string& metric,
                              AggregationOp op,
                              std::optional<std::string> group_by = std::nullopt) {
    MetricQuery query;
    query.group_by = std::move(group_by);
    return std::make_unique<MetricRefNode>(metric, AggregationRequest::Of(op), std::move(query));
}

std::unique_ptr<ExprNode> Constant(double value) {
    return std::make_unique<ValueNode>(value);
}

std::unique_ptr<ExprNode> Arithmetic(ArithmeticOp op, std::unique_ptr<ExprNode> lhs, std::unique_ptr<ExprNode> rhs) {
    return std::make_unique<ArithmeticNode>(op, std::move(lhs), std::move(rhs));
}

class ExpressionEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog_ = std::make_shared<catalog::MetricCatalog>();
        ASSERT_TRUE(catalog_->register_metric("used", MetricKind::GAUGE).ok());
        ASSERT_TRUE(catalog_->register_metric("total", MetricKind::GAUGE).ok());
        ASSERT_TRUE(catalog_->register_metric("zero", MetricKind::GAUGE).ok());
        store_ = std::make_unique<storage::PointStore>(catalog_);
        
        // Two hosts, windows [0,10) and [10,20)
        Insert("used", {{1, 2, "host:a"}, {11, 4, "host:a"}, {2, 6, "host:b"}, {12, 8, "host:b"}});
        Insert("total", {{1, 10, "host:a"}, {11, 10, "host:a"}, {2, 20, "host:b"}});
        Insert("zero", {{1, 0, "host:a"}, {11, 5, "host:a"}});
    }
    
    struct Sample {
        double ts;
        double value;
        std::string tag;
    };
    
    void Insert(const std::string& metric, const std::vector<Sample>& samples) {
        std::vector<Point> points;
        for (const auto& s : samples) {
            points.emplace_back(s.ts, s.value, Tags::Parse({s.tag}));
        }
        ASSERT_TRUE(store_->insert_batch(metric, std::move(points), storage::SourceContext{"test"}).ok());
    }
    
    Value Evaluate(const ExprNode* node) {
        ExpressionEvaluator evaluator(store_.get(), &partitioner_, &aggregator_, range_, 10, &context_);
        evaluator.Prepare(node);
        return evaluator.Evaluate(node);
    }
    
    std::shared_ptr<catalog::MetricCatalog> catalog_;
    std::unique_ptr<storage::PointStore> store_;
    GroupPartitioner partitioner_{"__ungrouped__"};
    WindowAggregator aggregator_;
    core::QueryContext context_;
    TimeRange range_{0, 20};
};

TEST_F(ExpressionEvaluatorTest, MetricRefUngrouped) {
    auto expr = Ref("used", AggregationOp::AVERAGE);
    auto value = Evaluate(expr.get());
    ASSERT_FALSE(value.isGrouped());
    ASSERT_EQ(value.series.size(), 1);
    EXPECT_EQ(value.series[0].samples, MakeSeries({{0, 4}, {10, 6}}));
}

TEST_F(ExpressionEvaluatorTest, MetricRefGrouped) {
    auto expr = Ref("used", AggregationOp::SUM, std::string("host"));
    auto value = Evaluate(expr.get());
    ASSERT_TRUE(value.isGrouped());
    ASSERT_EQ(value.series.size(), 2);
    EXPECT_EQ(*value.series[0].label, "a");
    EXPECT_EQ(value.series[0].samples, MakeSeries({{0, 2}, {10, 4}}));
    EXPECT_EQ(*value.series[1].label, "b");
}

TEST_F(ExpressionEvaluatorTest, ScalarBroadcast) {
    auto expr = Arithmetic(ArithmeticOp::MULTIPLY, Ref("used", AggregationOp::AVERAGE), Constant(10));
    auto value = Evaluate(expr.get());
    EXPECT_EQ(value.series[0].samples, MakeSeries({{0, 40}, {10, 60}}));
}

TEST_F(ExpressionEvaluatorTest, GroupedRatioJoinsOnTimestamps) {
    auto expr = Arithmetic(ArithmeticOp::DIVIDE,
                           Ref("used", AggregationOp::AVERAGE, std::string("host")),
                           Ref("total", AggregationOp::AVERAGE, std::string("host")));
    auto value = Evaluate(expr.get());
    ASSERT_TRUE(value.isGrouped());
    ASSERT_EQ(value.series.size(), 2);
    EXPECT_EQ(value.series[0].samples, MakeSeries({{0, 0.2}, {10, 0.4}}));
    // total has no [10,20) bucket for host b
    EXPECT_EQ(value.series[1].samples, MakeSeries({{0, 0.3}}));
}

TEST_F(ExpressionEvaluatorTest, DivideByZeroDropsBucket) {
    auto expr = Arithmetic(ArithmeticOp::DIVIDE, Ref("used", AggregationOp::AVERAGE), Ref("zero", AggregationOp::AVERAGE));
    auto value = Evaluate(expr.get());
    ASSERT_EQ(value.series.size(), 1);
    EXPECT_EQ(value.series[0].samples, MakeSeries({{10, 6.0 / 5.0}}));
}

TEST_F(ExpressionEvaluatorTest, DivideByConstantZeroDropsEverything) {
    auto expr = Arithmetic(ArithmeticOp::DIVIDE, Ref("used", AggregationOp::AVERAGE), Constant(0));
    auto value = Evaluate(expr.get());
    ASSERT_EQ(value.series.size(), 1);
    EXPECT_TRUE(value.series[0].samples.empty());
}

TEST_F(ExpressionEvaluatorTest, UngroupedBroadcastsAcrossGroups) {
    auto expr = Arithmetic(ArithmeticOp::SUBTRACT,
                           Ref("used", AggregationOp::AVERAGE, std::string("host")),
                           Ref("used", AggregationOp::AVERAGE));
    auto value = Evaluate(expr.get());
    ASSERT_TRUE(value.isGrouped());
    ASSERT_EQ(value.series.size(), 2);
    EXPECT_EQ(value.series[0].samples, MakeSeries({{0, -2}, {10, -2}}));
    EXPECT_EQ(value.series[1].samples, MakeSeries({{0, 2}, {10, 2}}));
}

TEST_F(ExpressionEvaluatorTest, GroupOrderFollowsFirstGroupedOperand) {
    Insert("total", {{3, 1, "host:c"}});
    auto expr = Arithmetic(ArithmeticOp::ADD,
                           Ref("used", AggregationOp::AVERAGE),
                           Ref("used", AggregationOp::AVERAGE, std::string("host")));
    auto value = Evaluate(expr.get());
    ASSERT_TRUE(value.isGrouped());
    std::vector<std::string> labels;
    for (const auto& s : value.series) {
        labels.push_back(*s.label);
    }
    EXPECT_THAT(labels, ElementsAre("a", "b"));
}

TEST_F(ExpressionEvaluatorTest, MismatchedGroupsRejected) {
    Insert("total", {{3, 1, "host:c"}});
    auto expr = Arithmetic(ArithmeticOp::DIVIDE,
                           Ref("used", AggregationOp::AVERAGE, std::string("host")),
                           Ref("total", AggregationOp::AVERAGE, std::string("host")));
    EXPECT_THROW(Evaluate(expr.get()), core::InvalidArgumentError);
}

TEST_F(ExpressionEvaluatorTest, ConstantsOnlyStayScalar) {
    auto expr = Arithmetic(ArithmeticOp::ADD, Constant(1), Constant(2));
    auto value = Evaluate(expr.get());
    ASSERT_TRUE(value.isScalar());
    EXPECT_DOUBLE_EQ(value.scalar, 3);
}

TEST_F(ExpressionEvaluatorTest, FunctionOverSeries) {
    std::vector<std::unique_ptr<ExprNode>> args;
    args.push_back(Arithmetic(ArithmeticOp::SUBTRACT, Ref("used", AggregationOp::AVERAGE), Constant(5)));
    args.push_back(Constant(2));
    FunctionNode power(Function::POWER, std::move(args));
    
    auto value = Evaluate(&power);
    EXPECT_EQ(value.series[0].samples, MakeSeries({{0, 1}, {10, 1}}));
}

TEST_F(ExpressionEvaluatorTest, UndefinedFunctionValueDropsBucket) {
    std::vector<std::unique_ptr<ExprNode>> args;
    args.push_back(Arithmetic(ArithmeticOp::SUBTRACT, Ref("used", AggregationOp::AVERAGE), Constant(5)));
    FunctionNode sqrt(Function::SQRT, std::move(args));
    
    // sqrt(4 - 5) is undefined, sqrt(6 - 5) = 1
    auto value = Evaluate(&sqrt);
    EXPECT_EQ(value.series[0].samples, MakeSeries({{10, 1}}));
}

TEST_F(ExpressionEvaluatorTest, MetricRefOutputFilterAppliesBeforeCombination) {
    MetricQuery query;
    query.output_filter = std::make_unique<CompareFilter>(CompareOp::GREATER_THAN,
                                                          std::make_unique<InputValueTransform>(),
                                                          std::make_unique<ValueTransform>(5));
    auto filtered = std::make_unique<MetricRefNode>("used", AggregationRequest::Of(AggregationOp::AVERAGE),
                                                    std::move(query));
    auto expr = Arithmetic(ArithmeticOp::ADD, std::move(filtered), Constant(100));
    auto value = Evaluate(expr.get());
    EXPECT_EQ(value.series[0].samples, MakeSeries({{10, 106}}));
}

TEST_F(ExpressionEvaluatorTest, MetricRefOutputTransformRunsBeforeFilter) {
    // Sqrt(InputValue - 5) over averages 4 and 6, then keep values > 0.5
    std::vector<std::unique_ptr<TransformNode>> args;
    args.push_back(std::make_unique<ArithmeticTransform>(ArithmeticOp::SUBTRACT,
                                                         std::make_unique<InputValueTransform>(),
                                                         std::make_unique<ValueTransform>(5)));
    MetricQuery query;
    query.output_transform = std::make_unique<FunctionTransform>(Function::SQRT, std::move(args));
    query.output_filter = std::make_unique<CompareFilter>(CompareOp::GREATER_THAN,
                                                          std::make_unique<InputValueTransform>(),
                                                          std::make_unique<ValueTransform>(0.5));
    auto transformed = std::make_unique<MetricRefNode>("used", AggregationRequest::Of(AggregationOp::AVERAGE),
                                                       std::move(query));
    EXPECT_EQ(transformed->String(), "Average(used map Sqrt(Subtract(InputValue, 5)) where GreaterThan(InputValue, 0.5))");
    
    auto expr = Arithmetic(ArithmeticOp::ADD, std::move(transformed), Constant(100));
    ExpressionEvaluator::Validate(expr.get());
    auto value = Evaluate(expr.get());
    EXPECT_EQ(value.series[0].samples, MakeSeries({{10, 101}}));
}

TEST_F(ExpressionEvaluatorTest, GroupedOutputTransform) {
    MetricQuery query;
    query.group_by = "host";
    query.output_transform = std::make_unique<ArithmeticTransform>(ArithmeticOp::MULTIPLY,
                                                                   std::make_unique<InputValueTransform>(),
                                                                   std::make_unique<ValueTransform>(10));
    MetricRefNode ref("used", AggregationRequest::Of(AggregationOp::SUM), std::move(query));
    auto value = Evaluate(&ref);
    ASSERT_EQ(value.series.size(), 2);
    EXPECT_EQ(value.series[0].samples, MakeSeries({{0, 20}, {10, 40}}));
    EXPECT_EQ(value.series[1].samples, MakeSeries({{0, 60}, {10, 80}}));
}

TEST_F(ExpressionEvaluatorTest, UnknownMetricIsNotFound) {
    auto expr = Ref("missing", AggregationOp::AVERAGE);
    try {
        Evaluate(expr.get());
        FAIL() << "Expected NOT_FOUND";
    } catch (const core::Error& e) {
        EXPECT_EQ(e.code(), core::Error::Code::NOT_FOUND);
    }
}

TEST(ExpressionValidationTest, RejectsMalformedTrees) {
    std::vector<std::unique_ptr<ExprNode>> args;
    args.push_back(std::make_unique<ValueNode>(1));
    FunctionNode bad_arity(Function::LOG_BASE, std::move(args));
    EXPECT_THROW(ExpressionEvaluator::Validate(&bad_arity), core::InvalidArgumentError);
    
    ArithmeticNode missing(ArithmeticOp::ADD, std::make_unique<ValueNode>(1), nullptr);
    EXPECT_THROW(ExpressionEvaluator::Validate(&missing), core::InvalidArgumentError);
    
    MetricRefNode percentile("cpu", AggregationRequest::Of(AggregationOp::PERCENTILE, 150), MetricQuery());
    EXPECT_THROW(ExpressionEvaluator::Validate(&percentile), core::InvalidArgumentError);
    
    MetricRefNode unnamed("", AggregationRequest::Of(AggregationOp::AVERAGE), MetricQuery());
    EXPECT_THROW(ExpressionEvaluator::Validate(&unnamed), core::InvalidArgumentError);
}

TEST(ExpressionValidationTest, RejectsMalformedOutputTransform) {
    std::vector<std::unique_ptr<TransformNode>> args;
    args.push_back(std::make_unique<InputValueTransform>());
    MetricQuery query;
    query.output_transform = std::make_unique<FunctionTransform>(Function::POWER, std::move(args));
    MetricRefNode ref("used", AggregationRequest::Of(AggregationOp::AVERAGE), std::move(query));
    EXPECT_THROW(ExpressionEvaluator::Validate(&ref), core::InvalidArgumentError);
}

TEST(ExpressionValidationTest, ReferencedMetricsDeduplicated) {
    auto expr = Arithmetic(ArithmeticOp::DIVIDE,
                           Arithmetic(ArithmeticOp::ADD, Ref("b", AggregationOp::AVERAGE), Ref("a", AggregationOp::SUM)),
                           Ref("b", AggregationOp::MAX));
    EXPECT_THAT(ExpressionEvaluator::ReferencedMetrics(expr.get()), ElementsAre("b", "a"));
}

} // namespace
} // namespace query
} // namespace metricdb
